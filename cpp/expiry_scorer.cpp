#include "expiry_scorer.hpp"

#include "periods.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <plog/Log.h>

namespace pharmiq {

ExpiryRiskScore score_expiry_risk(const ForecastResult& forecast, const InventoryState& batch,
                                  const EngineConfig& config) {
    ExpiryRiskScore score;
    score.batch_id = batch.batch_id;
    score.item_id = batch.item_id;

    const std::int64_t as_of = day_of(forecast.generated_at);
    const double days_left = static_cast<double>(std::max<std::int64_t>(0, batch.expiry_day - as_of));
    score.periods_until_expiry = days_left / days_per_period(forecast.granularity);

    if (batch.quantity_on_hand <= 0.0) return score;

    const double rate = std::max(0.0, forecast.predicted_quantity_per_period);
    const double will_consume = rate * score.periods_until_expiry;
    score.projected_wastage_quantity = std::max(0.0, batch.quantity_on_hand - will_consume);

    if (rate <= 0.0) {
        score.risk_probability = 1.0;
    } else {
        const double shortfall = std::max(0.0, 1.0 - will_consume / batch.quantity_on_hand);
        score.risk_probability = std::clamp(shortfall * config.risk_scale, 0.0, 1.0);
    }

    const bool return_open = batch.return_deadline_day.has_value() && as_of <= *batch.return_deadline_day;
    if (score.risk_probability >= config.return_threshold) {
        if (return_open) {
            score.recommended_action = ExpiryAction::RETURN_TO_SUPPLIER;
        } else {
            score.recommended_action = ExpiryAction::DISCOUNT;
            score.suggested_discount_pct = 50;
        }
    } else if (score.risk_probability >= config.discount_threshold) {
        if (config.prefer_redistribute) {
            score.recommended_action = ExpiryAction::REDISTRIBUTE;
        } else {
            score.recommended_action = ExpiryAction::DISCOUNT;
            score.suggested_discount_pct = 25;
        }
    }

    if (score.recommended_action != ExpiryAction::NONE) {
        PLOGI << fmt::format("Batch '{}' ({}): risk {:.2f}, {:.1f} unit(s) projected to expire, {}", batch.batch_id,
                             batch.item_id, score.risk_probability, score.projected_wastage_quantity,
                             to_string(score.recommended_action));
    }
    return score;
}

}
