#pragma once

#include <fmt/core.h>

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

// A filter maps any T to a valid T. It may throw to reject an input outright.
template<typename T>
using FilterFunction = std::function<T(T)>;

// Returns the filter unchanged, or throws std::invalid_argument if it is empty.
template<typename T>
FilterFunction<T> require_filter(FilterFunction<T> filter, std::string_view name = "filter")
{
    if (!filter)
    {
        throw std::invalid_argument(fmt::format("{} must not be empty", name));
    }
    return filter;
}

// Composes filters left to right: chain<T>(f, g)(x) == g(f(x)).
template<typename T, typename... Filters>
FilterFunction<T> chain(Filters&&... parts)
{
    std::vector<FilterFunction<T>> steps;
    steps.reserve(sizeof...(Filters));
    size_t index = 0;
    (steps.push_back(require_filter<T>(FilterFunction<T>{std::forward<Filters>(parts)},
                                       fmt::format("chain step {}", index++))),
     ...);

    return [steps = std::move(steps)](T value) {
        for (const auto& step : steps)
        {
            value = step(std::move(value));
        }
        return value;
    };
}
