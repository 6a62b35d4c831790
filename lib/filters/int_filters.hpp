#pragma once

#include "../filter_function.hpp"

#include <fmt/core.h>

#include <stdexcept>

namespace filters
{
    inline int at_least(int value, int min_value) { return value < min_value ? min_value : value; }

    inline int not_more_than(int value, int max_value) { return value > max_value ? max_value : value; }

    inline int clamp(int value, int min_value, int max_value)
    {
        return not_more_than(at_least(value, min_value), max_value);
    }

    // Gregorian month numbers.
    inline int in_month_range(int value) { return clamp(value, 1, 12); }

    // Counts, ages.
    inline int at_least_zero(int value) { return at_least(value, 0); }

    // Database ids.
    inline int at_least_one(int value) { return at_least(value, 1); }

    inline FilterFunction<int> at_least_filter(int min_value)
    {
        return [min_value](int value) { return at_least(value, min_value); };
    }

    inline FilterFunction<int> not_more_than_filter(int max_value)
    {
        return [max_value](int value) { return not_more_than(value, max_value); };
    }

    inline FilterFunction<int> clamp_filter(int min_value, int max_value)
    {
        if (min_value > max_value)
        {
            throw std::invalid_argument(fmt::format("empty range [{}, {}]", min_value, max_value));
        }
        return [min_value, max_value](int value) { return clamp(value, min_value, max_value); };
    }
}    // namespace filters
