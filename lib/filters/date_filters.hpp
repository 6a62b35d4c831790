#pragma once

#include <chrono>

namespace filters
{
    using TimePoint = std::chrono::system_clock::time_point;

    TimePoint on_or_after(TimePoint value, TimePoint min_value);
    TimePoint on_or_before(TimePoint value, TimePoint max_value);

    // For Excel dates and SQL smalldatetime columns.
    TimePoint on_or_after_1900(TimePoint value);

    // Nothing later than now.
    TimePoint before_future(TimePoint value, TimePoint now = std::chrono::system_clock::now());

    // Negative year counts count as zero. Going back from Feb 29 lands on Feb 28.
    // Counts reaching past the earliest TimePoint use TimePoint::min() as the bound.
    TimePoint not_more_than_years_ago(TimePoint value, int years, TimePoint now = std::chrono::system_clock::now());
    TimePoint at_least_years_ago(TimePoint value, int years, TimePoint now = std::chrono::system_clock::now());
}    // namespace filters
