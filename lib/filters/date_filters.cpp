#include "date_filters.hpp"
#include "int_filters.hpp"

namespace filters
{
    namespace
    {
        using namespace std::chrono;

        const TimePoint year_1900 = sys_days{year{1900} / January / 1};

        // Saturates to TimePoint::min() once the target date is out of range.
        TimePoint years_before(TimePoint now, int count)
        {
            const sys_days earliest = ceil<days>(TimePoint::min());

            auto midnight    = floor<days>(now);
            auto time_of_day = now - midnight;

            year_month_day date{midnight};
            long long target = static_cast<int>(date.year()) - static_cast<long long>(at_least_zero(count));
            if (target < static_cast<int>(year::min()))
            {
                return TimePoint::min();
            }

            date = year_month_day{year{static_cast<int>(target)}, date.month(), date.day()};
            if (!date.ok())
            {
                date = year_month_day{date.year() / date.month() / last};
            }

            sys_days start{date};
            if (start < earliest)
            {
                return TimePoint::min();
            }
            return start + time_of_day;
        }
    }    // namespace

    TimePoint on_or_after(TimePoint value, TimePoint min_value) { return value < min_value ? min_value : value; }

    TimePoint on_or_before(TimePoint value, TimePoint max_value) { return value > max_value ? max_value : value; }

    TimePoint on_or_after_1900(TimePoint value) { return on_or_after(value, year_1900); }

    TimePoint before_future(TimePoint value, TimePoint now) { return on_or_before(value, now); }

    TimePoint not_more_than_years_ago(TimePoint value, int years, TimePoint now)
    {
        return on_or_after(value, years_before(now, years));
    }

    TimePoint at_least_years_ago(TimePoint value, int years, TimePoint now)
    {
        return on_or_before(value, years_before(now, years));
    }
}    // namespace filters
