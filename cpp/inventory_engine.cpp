#include "inventory_engine.hpp"

#include "aggregator.hpp"
#include "anomaly_detector.hpp"
#include "errors.hpp"
#include "expiry_scorer.hpp"
#include "forecast_selector.hpp"
#include "reorder_optimizer.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <plog/Log.h>
#include <set>

namespace pharmiq {
namespace {

template <typename Fn>
bool guarded(RunReport& report, const std::string& item_id, const char* stage, Fn&& fn) {
    try {
        fn();
        return true;
    } catch (const EngineError& e) {
        PLOG_WARNING << fmt::format("Item '{}' {} failed ({}): {}", item_id, stage, e.kind(), e.what());
        report.failures.push_back({item_id, stage, e.kind(), e.what()});
    } catch (const std::exception& e) {
        PLOG_ERROR << fmt::format("Item '{}' {} failed: {}", item_id, stage, e.what());
        report.failures.push_back({item_id, stage, "internal", e.what()});
    }
    return false;
}

}

InventoryEngine::InventoryEngine(EngineConfig config) : config_(std::move(config)) {
    config_.validate();
}

TimeSeries InventoryEngine::aggregate(const std::string& item_id,
                                      const std::vector<ConsumptionRecord>& records,
                                      Granularity granularity,
                                      std::int64_t now) const {
    return aggregate_consumption(item_id, records, granularity, now, config_.min_history_periods);
}

ForecastResult InventoryEngine::forecast(const std::string& item_id,
                                         const TimeSeries& series,
                                         std::size_t horizon_periods,
                                         std::int64_t generated_at,
                                         ForecastCache* cache) const {
    if (cache == nullptr) {
        return select_forecast(item_id, series, horizon_periods, generated_at, config_);
    }

    const auto key = make_cache_key(item_id, series, horizon_periods, config_);
    if (auto cached = cache->find(key)) {
        PLOGD << fmt::format("Item '{}': reusing cached {} forecast", item_id, cached->model_name);
        cached->generated_at = generated_at;
        return *cached;
    }
    auto result = select_forecast(item_id, series, horizon_periods, generated_at, config_);
    cache->store(key, result);
    return result;
}

std::vector<AnomalyFlag> InventoryEngine::detectAnomalies(const TimeSeries& series) const {
    return detect_anomalies(series, config_);
}

std::optional<ConsumptionShift> InventoryEngine::detectShift(const TimeSeries& series) const {
    return detect_consumption_shift(series, config_);
}

std::optional<ReorderSuggestion> InventoryEngine::recommendReorder(const ForecastResult& forecast,
                                                                   const InventoryState& state,
                                                                   const std::vector<SupplierQuote>& suppliers) const {
    return recommend_reorder(forecast, state, suppliers, config_);
}

ExpiryRiskScore InventoryEngine::scoreExpiryRisk(const ForecastResult& forecast, const InventoryState& batch) const {
    return score_expiry_risk(forecast, batch, config_);
}

InteractionQueryResult InventoryEngine::checkInteractions(const std::vector<std::string>& drug_names,
                                                          const InteractionRuleBase& rules) const {
    return check_interactions(drug_names, rules, config_);
}

PrescriptionReview InventoryEngine::reviewPrescription(const std::vector<std::string>& drug_names,
                                                       const InteractionRuleBase& rules) const {
    return review_prescription(drug_names, rules, config_);
}

RunReport InventoryEngine::run(const RunInput& input, ForecastCache* cache) const {
    RunReport report;
    const auto records_by_item = group_by_item(input.records);

    std::set<std::string> items;
    for (const auto& [item_id, _] : records_by_item) items.insert(item_id);
    for (const auto& batch : input.batches) items.insert(batch.item_id);

    static const std::vector<ConsumptionRecord> no_records;

    for (const auto& item_id : items) {
        const auto found = records_by_item.find(item_id);
        const auto& records = found == records_by_item.end() ? no_records : found->second;

        TimeSeries series;
        if (!guarded(report, item_id, "aggregate",
                     [&] { series = aggregate(item_id, records, input.granularity, input.now); })) {
            continue;
        }

        auto flags = detectAnomalies(series);
        report.anomalies.insert(report.anomalies.end(), flags.begin(), flags.end());
        if (auto shift = detectShift(series)) report.shifts.push_back(*shift);

        ForecastResult result;
        if (!guarded(report, item_id, "forecast",
                     [&] { result = forecast(item_id, series, input.horizon_periods, input.now, cache); })) {
            continue;
        }

        guarded(report, item_id, "reorder", [&] {
            InventoryState state = consolidate_batches(item_id, input.batches);
            if (state.lead_time_days <= 0) {
                for (const auto& quote : input.suppliers) {
                    if (!quote_applies(quote, item_id) || quote.lead_time_days <= 0) continue;
                    if (state.lead_time_days <= 0 || quote.lead_time_days < state.lead_time_days) {
                        state.lead_time_days = quote.lead_time_days;
                    }
                }
            }
            if (auto suggestion = recommendReorder(result, state, input.suppliers)) {
                report.reorders.push_back(std::move(*suggestion));
            }
        });

        guarded(report, item_id, "expiry", [&] {
            for (const auto& batch : input.batches) {
                if (batch.item_id == item_id) report.expiry_scores.push_back(scoreExpiryRisk(result, batch));
            }
        });

        report.forecasts.push_back(std::move(result));
    }

    PLOGI << fmt::format("Run finished: {} item(s), {} forecast(s), {} reorder(s), {} failure(s)", items.size(),
                         report.forecasts.size(), report.reorders.size(), report.failures.size());
    return report;
}

}
