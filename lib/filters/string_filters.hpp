#pragma once

#include "../filter_function.hpp"

#include <optional>
#include <string>

namespace filters
{
    // A string that may be absent. Most filters below take a plain string;
    // use empty_if_null first, or lift them with on_present.
    using NullableString = std::optional<std::string>;

    NullableString empty_if_null(NullableString value);

    // Goes last in a chain, since earlier steps may leave an empty string behind.
    NullableString null_if_empty(NullableString value);

    // Applies a string filter to a present value; null stays null.
    FilterFunction<NullableString> on_present(FilterFunction<std::string> filter);

    // Strips leading and trailing whitespace.
    std::string trim(std::string value);

    // A max_length below 1 yields an empty string.
    std::string truncate_if_longer_than(std::string value, int max_length);
    FilterFunction<std::string> truncate_filter(int max_length);

    // Turns every run of whitespace or underscores into a single space.
    std::string collapse_white_space(std::string value);

    // Removes C0 control characters except tab, line feed and carriage return.
    std::string remove_control_chars(std::string value);

    // Keeps 0-9 only.
    std::string remove_non_digits(std::string value);
    std::string keep_only_arabic_digits(std::string value);

    // Keeps letters, digits and underscores.
    std::string keep_word_chars_only(std::string value);

    std::string remove_white_space(std::string value);
}    // namespace filters
