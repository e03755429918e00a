#pragma once

#include "types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pharmiq {

// Builds a gap-free series over [period(first record), period(now)] for one item. Records for
// other items, records dated after `now` and negative quantities are skipped with a warning.
// Throws InsufficientDataError when fewer than `min_periods` periods are covered.
TimeSeries aggregate_consumption(const std::string& item_id,
                                 const std::vector<ConsumptionRecord>& records,
                                 Granularity granularity,
                                 std::int64_t now,
                                 std::size_t min_periods);

std::map<std::string, std::vector<ConsumptionRecord>> group_by_item(
    const std::vector<ConsumptionRecord>& records);

}
