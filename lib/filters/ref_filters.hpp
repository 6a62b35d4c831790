#pragma once

#include <memory>
#include <stdexcept>

namespace filters
{
    // For strings use empty_if_null instead.
    template<typename U>
    std::shared_ptr<U> new_if_null(std::shared_ptr<U> value)
    {
        return value ? value : std::make_shared<U>();
    }

    template<typename U>
    std::shared_ptr<U> error_if_null(std::shared_ptr<U> value)
    {
        if (!value)
        {
            throw std::invalid_argument("value must not be null");
        }
        return value;
    }
}    // namespace filters
