#include "types.hpp"

#include <algorithm>

namespace pharmiq {

std::vector<double> TimeSeries::values() const {
    std::vector<double> out;
    out.reserve(points.size());
    for (const auto& point : points) out.push_back(point.quantity);
    return out;
}

TimeSeries TimeSeries::head(std::size_t count) const {
    TimeSeries out{item_id, granularity, {}};
    const std::size_t n = std::min(count, points.size());
    out.points.assign(points.begin(), points.begin() + static_cast<std::ptrdiff_t>(n));
    return out;
}

const char* to_string(Granularity granularity) {
    switch (granularity) {
        case Granularity::DAY:
            return "day";
        case Granularity::WEEK:
            return "week";
        case Granularity::MONTH:
            return "month";
    }
    return "day";
}

const char* to_string(ExpiryAction action) {
    switch (action) {
        case ExpiryAction::NONE:
            return "none";
        case ExpiryAction::DISCOUNT:
            return "discount";
        case ExpiryAction::RETURN_TO_SUPPLIER:
            return "return_to_supplier";
        case ExpiryAction::REDISTRIBUTE:
            return "redistribute";
    }
    return "none";
}

const char* to_string(AnomalySeverity severity) {
    switch (severity) {
        case AnomalySeverity::LOW:
            return "low";
        case AnomalySeverity::MEDIUM:
            return "medium";
        case AnomalySeverity::HIGH:
            return "high";
    }
    return "low";
}

const char* to_string(ShiftDirection direction) {
    return direction == ShiftDirection::INCREASE ? "increase" : "decrease";
}

const char* to_string(Severity severity) {
    switch (severity) {
        case Severity::NONE:
            return "none";
        case Severity::MINOR:
            return "minor";
        case Severity::MODERATE:
            return "moderate";
        case Severity::SEVERE:
            return "severe";
    }
    return "none";
}

const char* to_string(MatchSource source) {
    return source == MatchSource::RULE ? "rule" : "category";
}

}
