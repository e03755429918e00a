#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>

namespace pharmiq {

constexpr std::int64_t kSecondsPerDay = 86400;

std::int64_t day_of(std::int64_t timestamp);

// Day periods are epoch days, week periods count Monday-based weeks since the epoch week,
// month periods count calendar months since 1970-01 (UTC).
std::int64_t period_of(std::int64_t timestamp, Granularity granularity);

// Position of a period within its natural cycle: day-of-week (0 = Monday), week-of-year or
// month-of-year (0 = January).
int season_position(std::int64_t period, Granularity granularity);
std::size_t season_length(Granularity granularity);
double days_per_period(Granularity granularity);

}
