#include <gtest/gtest.h>

#include "filters/date_filters.hpp"

#include <chrono>
#include <limits>

using namespace std::chrono;
using filters::TimePoint;

namespace
{
    TimePoint date(int y, unsigned m, unsigned d) { return sys_days{year{y} / month{m} / day{d}}; }

    const TimePoint now = date(2024, 2, 29) + hours{13};
}    // namespace

TEST(DateFiltersTest, on_or_after_and_on_or_before)
{
    EXPECT_EQ(filters::on_or_after(date(1999, 1, 1), date(2000, 1, 1)), date(2000, 1, 1));
    EXPECT_EQ(filters::on_or_after(date(2001, 1, 1), date(2000, 1, 1)), date(2001, 1, 1));
    EXPECT_EQ(filters::on_or_before(date(2001, 1, 1), date(2000, 1, 1)), date(2000, 1, 1));
    EXPECT_EQ(filters::on_or_before(date(1999, 1, 1), date(2000, 1, 1)), date(1999, 1, 1));
}

TEST(DateFiltersTest, on_or_after_1900)
{
    EXPECT_EQ(filters::on_or_after_1900(date(1850, 3, 3)), date(1900, 1, 1));
    EXPECT_EQ(filters::on_or_after_1900(date(1969, 7, 20)), date(1969, 7, 20));
}

TEST(DateFiltersTest, before_future)
{
    EXPECT_EQ(filters::before_future(date(2030, 1, 1), now), now);
    EXPECT_EQ(filters::before_future(date(2020, 1, 1), now), date(2020, 1, 1));

    auto past = date(2001, 9, 1);
    EXPECT_EQ(filters::before_future(past), past);
}

TEST(DateFiltersTest, not_more_than_years_ago)
{
    EXPECT_EQ(filters::not_more_than_years_ago(date(2010, 1, 1), 10, now), date(2014, 2, 28) + hours{13});
    EXPECT_EQ(filters::not_more_than_years_ago(date(2020, 1, 1), 10, now), date(2020, 1, 1));
    EXPECT_EQ(filters::not_more_than_years_ago(date(2020, 1, 1), -5, now), now);
}

TEST(DateFiltersTest, at_least_years_ago)
{
    EXPECT_EQ(filters::at_least_years_ago(date(2020, 1, 1), 18, now), date(2006, 2, 28) + hours{13});
    EXPECT_EQ(filters::at_least_years_ago(date(2000, 1, 1), 18, now), date(2000, 1, 1));
    EXPECT_EQ(filters::at_least_years_ago(date(2020, 1, 1), 4, now), date(2020, 1, 1));
    EXPECT_EQ(filters::at_least_years_ago(date(2021, 1, 1), 4, now), date(2020, 2, 29) + hours{13});
}

TEST(DateFiltersTest, huge_year_counts_saturate_to_earliest_time)
{
    const int forever = std::numeric_limits<int>::max();

    EXPECT_EQ(filters::not_more_than_years_ago(date(2000, 1, 1), forever, now), date(2000, 1, 1));
    EXPECT_EQ(filters::not_more_than_years_ago(date(2000, 1, 1), 40000, now), date(2000, 1, 1));
    EXPECT_EQ(filters::not_more_than_years_ago(date(2000, 1, 1), 400, now), date(2000, 1, 1));

    EXPECT_EQ(filters::at_least_years_ago(date(2000, 1, 1), forever, now), TimePoint::min());
    EXPECT_EQ(filters::at_least_years_ago(date(2000, 1, 1), 40000, now), TimePoint::min());
    EXPECT_EQ(filters::at_least_years_ago(date(2000, 1, 1), 400, now), TimePoint::min());
}

TEST(DateFiltersTest, year_counts_within_range_still_subtract)
{
    EXPECT_EQ(filters::at_least_years_ago(date(2000, 1, 1), 300, now), date(1724, 2, 29) + hours{13});
}
