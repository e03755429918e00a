#include "periods.hpp"

#include <ctime>

namespace pharmiq {
namespace {

std::int64_t floor_div(std::int64_t value, std::int64_t divisor) {
    std::int64_t q = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) --q;
    return q;
}

std::int64_t floor_mod(std::int64_t value, std::int64_t divisor) {
    return value - floor_div(value, divisor) * divisor;
}

}

std::int64_t day_of(std::int64_t timestamp) {
    return floor_div(timestamp, kSecondsPerDay);
}

std::int64_t period_of(std::int64_t timestamp, Granularity granularity) {
    switch (granularity) {
        case Granularity::DAY:
            return day_of(timestamp);
        case Granularity::WEEK:
            // 1970-01-01 was a Thursday.
            return floor_div(day_of(timestamp) + 3, 7);
        case Granularity::MONTH: {
            const std::time_t t = static_cast<std::time_t>(timestamp);
            std::tm tmv{};
            gmtime_r(&t, &tmv);
            return static_cast<std::int64_t>(tmv.tm_year - 70) * 12 + tmv.tm_mon;
        }
    }
    return day_of(timestamp);
}

int season_position(std::int64_t period, Granularity granularity) {
    switch (granularity) {
        case Granularity::DAY:
            return static_cast<int>(floor_mod(period + 3, 7));
        case Granularity::WEEK:
            return static_cast<int>(floor_mod(period, 52));
        case Granularity::MONTH:
            return static_cast<int>(floor_mod(period, 12));
    }
    return 0;
}

std::size_t season_length(Granularity granularity) {
    switch (granularity) {
        case Granularity::DAY:
            return 7;
        case Granularity::WEEK:
            return 52;
        case Granularity::MONTH:
            return 12;
    }
    return 7;
}

double days_per_period(Granularity granularity) {
    switch (granularity) {
        case Granularity::DAY:
            return 1.0;
        case Granularity::WEEK:
            return 7.0;
        case Granularity::MONTH:
            return 365.25 / 12.0;
    }
    return 1.0;
}

}
