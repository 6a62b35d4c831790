#include "string_filters.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace filters
{
    namespace
    {
        bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

        bool is_control(char c)
        {
            auto code = static_cast<unsigned char>(c);
            return code < 0x20 && c != '\t' && c != '\n' && c != '\r';
        }

        bool is_digit(char c) { return c >= '0' && c <= '9'; }

        bool is_word(char c)
        {
            return is_digit(c) || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
        }

        bool is_gap(char c) { return is_space(c) || c == '_'; }
    }    // namespace

    NullableString empty_if_null(NullableString value)
    {
        if (!value.has_value())
        {
            return std::string{};
        }
        return value;
    }

    NullableString null_if_empty(NullableString value)
    {
        if (!value.has_value() || value->empty())
        {
            return std::nullopt;
        }
        return value;
    }

    FilterFunction<NullableString> on_present(FilterFunction<std::string> filter)
    {
        return [filter = require_filter<std::string>(std::move(filter))](NullableString value) -> NullableString {
            if (!value.has_value())
            {
                return std::nullopt;
            }
            return filter(std::move(*value));
        };
    }

    std::string trim(std::string value)
    {
        auto first = std::find_if_not(value.begin(), value.end(), is_space);
        auto last  = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
        if (first >= last)
        {
            return {};
        }
        return std::string(first, last);
    }

    std::string truncate_if_longer_than(std::string value, int max_length)
    {
        if (max_length < 1)
        {
            return {};
        }
        if (value.size() > static_cast<size_t>(max_length))
        {
            value.resize(static_cast<size_t>(max_length));
        }
        return value;
    }

    FilterFunction<std::string> truncate_filter(int max_length)
    {
        return [max_length](std::string value) { return truncate_if_longer_than(std::move(value), max_length); };
    }

    std::string collapse_white_space(std::string value)
    {
        std::string collapsed;
        collapsed.reserve(value.size());
        bool in_gap = false;
        for (char c : value)
        {
            if (!is_gap(c))
            {
                collapsed.push_back(c);
                in_gap = false;
            }
            else if (!in_gap)
            {
                collapsed.push_back(' ');
                in_gap = true;
            }
        }
        return collapsed;
    }

    std::string remove_control_chars(std::string value)
    {
        std::erase_if(value, is_control);
        return value;
    }

    std::string remove_non_digits(std::string value) { return keep_only_arabic_digits(std::move(value)); }

    std::string keep_only_arabic_digits(std::string value)
    {
        std::erase_if(value, [](char c) { return !is_digit(c); });
        return value;
    }

    std::string keep_word_chars_only(std::string value)
    {
        std::erase_if(value, [](char c) { return !is_word(c); });
        return value;
    }

    std::string remove_white_space(std::string value)
    {
        std::erase_if(value, is_space);
        return value;
    }
}    // namespace filters
