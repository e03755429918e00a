#include "aggregator.hpp"

#include "errors.hpp"
#include "periods.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <limits>
#include <plog/Log.h>

namespace pharmiq {

TimeSeries aggregate_consumption(const std::string& item_id,
                                 const std::vector<ConsumptionRecord>& records,
                                 Granularity granularity,
                                 std::int64_t now,
                                 std::size_t min_periods) {
    const std::int64_t last_period = period_of(now, granularity);
    std::int64_t first_period = std::numeric_limits<std::int64_t>::max();
    std::map<std::int64_t, double> totals;
    std::size_t skipped_future = 0;
    std::size_t skipped_negative = 0;

    for (const auto& record : records) {
        if (record.item_id != item_id) continue;
        if (record.timestamp > now) {
            ++skipped_future;
            continue;
        }
        if (record.quantity_consumed < 0.0) {
            ++skipped_negative;
            continue;
        }
        const std::int64_t period = period_of(record.timestamp, granularity);
        totals[period] += record.quantity_consumed;
        first_period = std::min(first_period, period);
    }

    if (skipped_future > 0) {
        PLOG_WARNING << fmt::format("Item '{}': skipped {} record(s) dated after the run time", item_id,
                                    skipped_future);
    }
    if (skipped_negative > 0) {
        PLOG_WARNING << fmt::format("Item '{}': skipped {} record(s) with negative quantity", item_id,
                                    skipped_negative);
    }

    if (totals.empty()) {
        throw InsufficientDataError(fmt::format("item '{}' has no consumption history", item_id));
    }

    const auto covered = static_cast<std::size_t>(last_period - first_period + 1);
    if (covered < min_periods) {
        throw InsufficientDataError(fmt::format("item '{}' has {} {} period(s) of history, {} required",
                                                item_id, covered, to_string(granularity), min_periods));
    }

    TimeSeries series{item_id, granularity, {}};
    series.points.reserve(covered);
    for (std::int64_t period = first_period; period <= last_period; ++period) {
        const auto it = totals.find(period);
        series.points.push_back({period, it == totals.end() ? 0.0 : it->second});
    }

    PLOGD << fmt::format("Item '{}': aggregated {} {} period(s)", item_id, series.size(), to_string(granularity));
    return series;
}

std::map<std::string, std::vector<ConsumptionRecord>> group_by_item(
    const std::vector<ConsumptionRecord>& records) {
    std::map<std::string, std::vector<ConsumptionRecord>> grouped;
    for (const auto& record : records) {
        grouped[record.item_id].push_back(record);
    }
    return grouped;
}

}
