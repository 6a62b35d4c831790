#pragma once

#include "filtered.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>

// Object flavour of Filtered: it has identity, lives on the heap behind a
// shared_ptr and may be derived from. Copying is not allowed; several holders
// share one instance instead.
//
// Derived types have to pass a filter to this constructor since there is no
// other one. FilteredFactory covers the common case without derivation.
template<typename T>
struct SharedFiltered
{
    using value_type = T;

    explicit SharedFiltered(FilterFunction<T> filter, T initial = T{})
        : m_state{std::move(filter), std::move(initial)}
    {
    }

    virtual ~SharedFiltered() = default;

    static std::shared_ptr<SharedFiltered> create(FilterFunction<T> filter, T initial = T{})
    {
        return std::make_shared<SharedFiltered>(std::move(filter), std::move(initial));
    }

    const T& value() const { return m_state.value(); }
    void set_value(T value) { m_state.set_value(std::move(value)); }

    const FilterFunction<T>& filter() const { return m_state.filter(); }
    void set_filter(FilterFunction<T> filter) { m_state.set_filter(std::move(filter)); }

    friend bool operator==(const SharedFiltered& lhs, const SharedFiltered& rhs) { return lhs.value() == rhs.value(); }
    friend bool operator==(const SharedFiltered& lhs, const T& rhs) { return lhs.value() == rhs; }

    SharedFiltered(const SharedFiltered&)            = delete;
    SharedFiltered& operator=(const SharedFiltered&) = delete;

private:
    Filtered<T> m_state;
};

namespace std
{
    template<typename T>
    struct hash<SharedFiltered<T>>
    {
        size_t operator()(const SharedFiltered<T>& filtered) const { return hash<T>{}(filtered.value()); }
    };
}    // namespace std

namespace fmt
{
    template<typename T>
    struct formatter<SharedFiltered<T>> : formatter<T>
    {
        template<typename FormatContext>
        auto format(const SharedFiltered<T>& filtered, FormatContext& ctx) const
        {
            return formatter<T>::format(filtered.value(), ctx);
        }
    };
}    // namespace fmt
