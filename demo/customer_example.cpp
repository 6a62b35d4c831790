#include "customer_example.hpp"

#include "filtered.hpp"
#include "filtered_factory.hpp"
#include "filters/int_filters.hpp"
#include "filters/string_filters.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <regex>
#include <string>

// ##################################################
// ##################################################
// ##################################################
// Validators shared by the record types below

namespace validators
{
    std::string name(std::string value)
    {
        return filters::truncate_if_longer_than(
            filters::collapse_white_space(filters::trim(filters::remove_control_chars(std::move(value)))), 255);
    }

    // CAS registry number, e.g. 7732-18-5. Anything with a bad layout or a
    // bad check digit becomes the empty string.
    std::string cas_registry_number(std::string value)
    {
        static const std::regex layout{R"((\d{2,7})-(\d{2})-(\d))"};
        std::smatch match;
        if (!std::regex_match(value, match, layout))
        {
            return {};
        }

        std::string digits = match[1].str() + match[2].str();
        int sum            = 0;
        int weight         = 1;
        for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++weight)
        {
            sum += (*it - '0') * weight;
        }
        return (sum % 10) == (match[3].str()[0] - '0') ? value : std::string{};
    }
}    // namespace validators

// ##################################################
// ##################################################
// ##################################################
// A record whose fields can never hold an invalid value

namespace
{
    const FilteredFactory<filters::NullableString> name_string{
        chain<filters::NullableString>(filters::empty_if_null, filters::on_present(validators::name))};

    struct Customer
    {
        std::string first_name() const { return *m_first_name.value(); }
        void set_first_name(filters::NullableString value) { m_first_name = std::move(value); }

        std::string last_name() const { return *m_last_name.value(); }
        void set_last_name(filters::NullableString value) { m_last_name = std::move(value); }

        int age() const { return m_age; }
        void set_age(int value) { m_age = value; }

    private:
        Filtered<filters::NullableString> m_first_name = name_string();
        Filtered<filters::NullableString> m_last_name  = name_string();
        Filtered<int> m_age{filters::clamp_filter(0, 130)};
    };
}    // namespace

#define RED "\33[0;31m"
#define GREEN "\33[0;32m"
#define COLOR_RESET "\33[0m"

void customer_record()
{
    fmt::print("######################\n{}\n\n", __func__);

    Customer customer;
    fmt::print("fresh:   first=\"{}\" last=\"{}\" age={}\n", customer.first_name(), customer.last_name(),
               customer.age());

    customer.set_first_name("  Richard \t ");
    customer.set_last_name(std::nullopt);
    customer.set_age(-4);
    fmt::print("updated: first=\"{}\" last=\"{}\" age={}\n", customer.first_name(), customer.last_name(),
               customer.age());

    customer.set_last_name("Tallent\x07__II");
    customer.set_age(250);
    fmt::print("updated: first=\"{}\" last=\"{}\" age={}\n", customer.first_name(), customer.last_name(),
               customer.age());
}

void chemical_registry()
{
    fmt::print("######################\n{}\n\n", __func__);

    Filtered<std::string> cas{validators::cas_registry_number};
    for (auto raw : {"7732-18-5", "7732-18-6", "64-17-5", "not a number"})
    {
        cas = raw;
        const char* color = cas.value().empty() ? RED : GREEN;
        fmt::print("  {:<14} -> {}\"{}\"{}\n", raw, color, cas, COLOR_RESET);
    }
}

void customer_example()
{
    customer_record();
    chemical_registry();
}
