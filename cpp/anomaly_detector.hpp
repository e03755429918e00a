#pragma once

#include "config.hpp"
#include "types.hpp"

#include <optional>
#include <vector>

namespace pharmiq {

// Trailing moving-average detector. Each period from index `anomaly_window` onward is compared
// with the mean and population standard deviation of the preceding window. Series shorter
// than window + 1 produce no flags.
std::vector<AnomalyFlag> detect_anomalies(const TimeSeries& series, const EngineConfig& config);

// Compares the mean of the last `shift_window` periods with the window before it.
std::optional<ConsumptionShift> detect_consumption_shift(const TimeSeries& series, const EngineConfig& config);

}
