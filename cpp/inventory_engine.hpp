#pragma once

#include "config.hpp"
#include "forecast_cache.hpp"
#include "interaction_matcher.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pharmiq {

class InventoryEngine {
public:
    // Throws ConfigurationError when `config` fails validation.
    explicit InventoryEngine(EngineConfig config = {});

    const EngineConfig& config() const { return config_; }

    TimeSeries aggregate(const std::string& item_id,
                         const std::vector<ConsumptionRecord>& records,
                         Granularity granularity,
                         std::int64_t now) const;

    ForecastResult forecast(const std::string& item_id,
                            const TimeSeries& series,
                            std::size_t horizon_periods,
                            std::int64_t generated_at,
                            ForecastCache* cache = nullptr) const;

    std::vector<AnomalyFlag> detectAnomalies(const TimeSeries& series) const;
    std::optional<ConsumptionShift> detectShift(const TimeSeries& series) const;

    std::optional<ReorderSuggestion> recommendReorder(const ForecastResult& forecast,
                                                      const InventoryState& state,
                                                      const std::vector<SupplierQuote>& suppliers) const;

    ExpiryRiskScore scoreExpiryRisk(const ForecastResult& forecast, const InventoryState& batch) const;

    InteractionQueryResult checkInteractions(const std::vector<std::string>& drug_names,
                                             const InteractionRuleBase& rules) const;
    PrescriptionReview reviewPrescription(const std::vector<std::string>& drug_names,
                                          const InteractionRuleBase& rules) const;

    // Runs every item found in the snapshot. A failing item is recorded in
    // RunReport::failures and the remaining items still run.
    RunReport run(const RunInput& input, ForecastCache* cache = nullptr) const;

private:
    EngineConfig config_;
};

}
