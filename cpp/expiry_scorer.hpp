#pragma once

#include "config.hpp"
#include "types.hpp"

namespace pharmiq {

// Scores one batch against the forecast consumption rate. The as-of date is the day the
// forecast was generated.
ExpiryRiskScore score_expiry_risk(const ForecastResult& forecast, const InventoryState& batch,
                                  const EngineConfig& config);

}
