#include "reorder_optimizer.hpp"

#include "periods.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <plog/Log.h>

namespace pharmiq {
namespace {

struct RankedQuote {
    const SupplierQuote* quote;
    double quantity;
    double cost;
};

double order_quantity_for(double base_quantity, const SupplierQuote& quote) {
    return std::max(base_quantity, std::ceil(quote.minimum_order_quantity));
}

}

bool quote_applies(const SupplierQuote& quote, const std::string& item_id) {
    return quote.item_id.empty() || quote.item_id == item_id;
}

ReorderPoint compute_reorder_point(const ForecastResult& forecast, int lead_time_days, const EngineConfig& config) {
    const double period_days = days_per_period(forecast.granularity);
    const double lead_time = std::max(0, lead_time_days);

    ReorderPoint point{};
    point.daily_demand = forecast.predicted_quantity_per_period / period_days;
    point.daily_std_dev = forecast.residual_std_dev / std::sqrt(period_days);
    point.safety_stock = config.service_level_z * point.daily_std_dev * std::sqrt(lead_time);
    point.reorder_point = point.daily_demand * lead_time + point.safety_stock;
    return point;
}

std::optional<ReorderSuggestion> recommend_reorder(const ForecastResult& forecast,
                                                   const InventoryState& state,
                                                   const std::vector<SupplierQuote>& suppliers,
                                                   const EngineConfig& config) {
    const auto point = compute_reorder_point(forecast, state.lead_time_days, config);
    if (state.quantity_on_hand > point.reorder_point) {
        PLOGD << fmt::format("Item '{}': on hand {} above reorder point {:.2f}", forecast.item_id,
                             state.quantity_on_hand, point.reorder_point);
        return std::nullopt;
    }

    const double demand = point.daily_demand * config.replenishment_horizon_days;
    const double base_quantity =
        std::max(0.0, std::ceil(demand - state.quantity_on_hand - state.quantity_in_transit - 1e-6));
    if (base_quantity == 0.0) {
        PLOGD << fmt::format("Item '{}': horizon demand {:.2f} covered by {} on hand and {} in transit",
                             forecast.item_id, demand, state.quantity_on_hand, state.quantity_in_transit);
        return std::nullopt;
    }

    ReorderSuggestion suggestion;
    suggestion.item_id = forecast.item_id;
    suggestion.suggested_order_date = day_of(forecast.generated_at);
    suggestion.reorder_point = point.reorder_point;
    suggestion.safety_stock = point.safety_stock;
    if (point.daily_demand > 0.0) suggestion.days_of_cover = state.quantity_on_hand / point.daily_demand;
    suggestion.rationale_tags.push_back("below_reorder_point");
    if (state.quantity_in_transit > 0.0) {
        suggestion.rationale_tags.push_back("partly_covered_by_in_transit");
    }

    std::vector<RankedQuote> ranked;
    for (const auto& quote : suppliers) {
        if (!quote_applies(quote, forecast.item_id)) continue;
        const double quantity = order_quantity_for(base_quantity, quote);
        ranked.push_back({&quote, quantity, quantity * quote.unit_cost + quote.fixed_order_cost});
    }

    if (ranked.empty()) {
        PLOG_WARNING << fmt::format("Item '{}' breaches its reorder point but has no supplier", forecast.item_id);
        suggestion.suggested_quantity = base_quantity;
        suggestion.estimated_cost = base_quantity * state.unit_cost;
        suggestion.rationale_tags.push_back("missing_supplier");
        return suggestion;
    }

    std::sort(ranked.begin(), ranked.end(), [](const RankedQuote& a, const RankedQuote& b) {
        if (std::fabs(a.cost - b.cost) > 1e-9) return a.cost < b.cost;
        if (a.quote->lead_time_days != b.quote->lead_time_days) return a.quote->lead_time_days < b.quote->lead_time_days;
        return a.quote->supplier_id < b.quote->supplier_id;
    });

    const auto& best = ranked.front();
    suggestion.supplier_id = best.quote->supplier_id;
    suggestion.suggested_quantity = best.quantity;
    suggestion.estimated_cost = best.cost;
    if (best.quantity > base_quantity) {
        suggestion.rationale_tags.push_back("moq_applied");
    }
    suggestion.rationale_tags.push_back(fmt::format("selected:{}", best.quote->supplier_id));
    for (std::size_t i = 1; i < ranked.size() && i <= config.max_runner_ups; ++i) {
        suggestion.rationale_tags.push_back(
            fmt::format("runner_up:{}:{:.2f}", ranked[i].quote->supplier_id, ranked[i].cost));
    }

    PLOGI << fmt::format("Item '{}': order {} from {} (cost {:.2f})", forecast.item_id, suggestion.suggested_quantity,
                         best.quote->supplier_id, suggestion.estimated_cost);
    return suggestion;
}

InventoryState consolidate_batches(const std::string& item_id, const std::vector<InventoryState>& batches) {
    InventoryState total;
    total.item_id = item_id;
    total.batch_id = item_id;
    bool first = true;
    for (const auto& batch : batches) {
        if (batch.item_id != item_id) continue;
        total.quantity_on_hand += batch.quantity_on_hand;
        total.quantity_in_transit += batch.quantity_in_transit;
        if (first || batch.expiry_day > total.expiry_day) {
            total.expiry_day = batch.expiry_day;
            total.lead_time_days = batch.lead_time_days;
            total.supplier_id = batch.supplier_id;
            total.unit_cost = batch.unit_cost;
            first = false;
        }
    }
    return total;
}

}
