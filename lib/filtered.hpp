#pragma once

#include "filter_function.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <functional>
#include <utility>

// Holds a value that has always passed through the current filter.
// Copies carry both the value and the filter.
template<typename T>
struct Filtered
{
    using value_type = T;

    // The initial value is filtered too, including the default T{}.
    // m_filter is declared first so it is ready before m_value is built from it.
    explicit Filtered(FilterFunction<T> filter, T initial = T{})
        : m_filter{require_filter<T>(std::move(filter))}, m_value{m_filter(std::move(initial))}
    {
    }

    const T& value() const { return m_value; }
    operator const T&() const { return m_value; }

    void set_value(T value) { m_value = m_filter(std::move(value)); }

    Filtered& operator=(T value)
    {
        set_value(std::move(value));
        return *this;
    }

    const FilterFunction<T>& filter() const { return m_filter; }

    // Re-filters the current value with the new filter. Nothing changes if
    // the filter is empty or throws.
    void set_filter(FilterFunction<T> filter)
    {
        auto replacement = require_filter<T>(std::move(filter));
        T refiltered     = replacement(m_value);
        m_filter         = std::move(replacement);
        m_value          = std::move(refiltered);
    }

    // Only the values take part; the filters are ignored.
    friend bool operator==(const Filtered& lhs, const Filtered& rhs) { return lhs.m_value == rhs.m_value; }
    friend bool operator==(const Filtered& lhs, const T& rhs) { return lhs.m_value == rhs; }

    // No move operations: a moved-from value may not satisfy the filter and a
    // moved-from filter may be empty, so moves fall back to copies.
    Filtered(const Filtered&) = default;

    // Copy first, then swap: a throwing copy of T leaves *this untouched.
    Filtered& operator=(const Filtered& other)
    {
        Filtered copy{other};
        std::swap(m_value, copy.m_value);
        m_filter.swap(copy.m_filter);
        return *this;
    }

private:
    FilterFunction<T> m_filter;
    T m_value;
};

namespace std
{
    template<typename T>
    struct hash<Filtered<T>>
    {
        size_t operator()(const Filtered<T>& filtered) const { return hash<T>{}(filtered.value()); }
    };
}    // namespace std

namespace fmt
{
    template<typename T>
    struct formatter<Filtered<T>> : formatter<T>
    {
        template<typename FormatContext>
        auto format(const Filtered<T>& filtered, FormatContext& ctx) const
        {
            return formatter<T>::format(filtered.value(), ctx);
        }
    };
}    // namespace fmt
