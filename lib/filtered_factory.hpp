#pragma once

#include "filtered.hpp"
#include "shared_filtered.hpp"

#include <memory>
#include <utility>

// A named validated type: the filter is fixed once, every instance made here
// starts out filtered by it.
//
//     const FilteredFactory<int> age{filters::clamp_filter(0, 130)};
//     Filtered<int> a = age(42);
template<typename T>
struct FilteredFactory
{
    explicit FilteredFactory(FilterFunction<T> filter) : m_filter{require_filter<T>(std::move(filter))} {}

    Filtered<T> operator()(T initial = T{}) const { return Filtered<T>{m_filter, std::move(initial)}; }

    std::shared_ptr<SharedFiltered<T>> make_shared(T initial = T{}) const
    {
        return SharedFiltered<T>::create(m_filter, std::move(initial));
    }

    const FilterFunction<T>& filter() const { return m_filter; }

private:
    FilterFunction<T> m_filter;
};
