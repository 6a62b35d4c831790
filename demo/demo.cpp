#include "filtered.hpp"
#include "filtered_factory.hpp"
#include "shared_filtered.hpp"
#include "filters/date_filters.hpp"
#include "filters/int_filters.hpp"
#include "filters/string_filters.hpp"

#include "customer_example.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <fmt/format.h>

#include <stdexcept>
#include <unordered_set>

namespace fmt
{
    template<typename T>
    struct formatter<std::optional<T>> : fmt::formatter<T>
    {
        template<typename FormatContext>
        auto format(const std::optional<T>& opt, FormatContext& ctx) const
        {
            if (opt)
            {
                return fmt::format_to(ctx.out(), "Some(\"{}\")", *opt);
            }
            return fmt::format_to(ctx.out(), "None");
        }
    };
}    // namespace fmt

void demo_filtered()
{
    fmt::print("### {} ###\n", __func__);

    Filtered<int> age{filters::clamp_filter(0, 130), -5};
    fmt::print("construct(-5):      {}\n", age);
    age = 200;
    fmt::print("set_value(200):     {}\n", age);
    age.set_filter(filters::clamp_filter(18, 130));
    fmt::print("set_filter(18-130): {}\n", age);
    age = 10;
    fmt::print("set_value(10):      {}\n", age);

    auto name_filter = chain<filters::NullableString>(filters::empty_if_null, filters::on_present(filters::trim));
    Filtered<filters::NullableString> name{name_filter};
    fmt::print("construct():        {}\n", name.value());
    name = std::string{"  hi  "};
    fmt::print("set_value(\"  hi  \"): {}\n", name.value());

    try
    {
        age.set_filter(nullptr);
    }
    catch (const std::invalid_argument& e)
    {
        fmt::print("set_filter(null):   rejected ({}), value still {}\n", e.what(), age);
    }
}

void demo_shared_filtered()
{
    fmt::print("### {} ###\n", __func__);

    auto month = SharedFiltered<int>::create(filters::in_month_range, 0);
    auto alias = month;
    fmt::print("construct(0):       {}\n", *month);
    alias->set_value(15);
    fmt::print("alias set 15:       {} (same object: {})\n", *month, month == alias);

    auto other = SharedFiltered<int>::create([](int x) { return x; }, 12);
    fmt::print("equal values:       {} (filters differ)\n", *month == *other);

    std::unordered_set<Filtered<int>> seen;
    for (int raw : {-3, 0, 7, 40})
    {
        seen.insert(Filtered<int>{filters::at_least_zero, raw});
    }
    fmt::print("distinct filtered:  {}\n", seen.size());
}

void demo_factory()
{
    fmt::print("### {} ###\n", __func__);

    const FilteredFactory<std::string> digits{chain<std::string>(filters::trim, filters::keep_only_arabic_digits)};
    for (auto raw : {"Hello world 123", " 555-0100 ", ""})
    {
        fmt::print("{:<20} -> \"{}\"\n", fmt::format("\"{}\"", raw), digits(raw));
    }

    using namespace std::chrono;
    const FilteredFactory<filters::TimePoint> birth_date{[](filters::TimePoint t) {
        return filters::before_future(filters::on_or_after_1900(t));
    }};
    auto date = birth_date.make_shared(sys_days{year{1850} / March / 3});
    fmt::print("1850-03-03 -> {:%F}\n", fmt::gmtime(system_clock::to_time_t(date->value())));
}

int main()
{
    demo_filtered();
    fmt::print("\n");
    demo_shared_filtered();
    fmt::print("\n");
    demo_factory();
    fmt::print("\n");
    customer_example();
}
