#pragma once

#include "config.hpp"
#include "forecast_models.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pharmiq {

// Builds the candidate models in tie-break priority order.
using CandidateFactory = std::function<std::vector<std::unique_ptr<ForecastModel>>(const EngineConfig&)>;

// Fits every candidate on a trailing-holdout split, keeps the lowest validation error (ties go
// to the earlier candidate), refits the winner on the full series and forecasts `horizon`
// periods. Throws InsufficientDataError below `config.min_history_periods`. When no candidate
// can be fitted the forecast falls back to the series mean, flagged low confidence.
ForecastResult select_forecast(const std::string& item_id,
                               const TimeSeries& series,
                               std::size_t horizon,
                               std::int64_t generated_at,
                               const EngineConfig& config,
                               const CandidateFactory& candidates = make_candidates);

}
