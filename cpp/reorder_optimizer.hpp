#pragma once

#include "config.hpp"
#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pharmiq {

struct ReorderPoint {
    double daily_demand;
    double daily_std_dev;
    double safety_stock;
    double reorder_point;
};

// Quotes with an empty item_id apply to every item.
bool quote_applies(const SupplierQuote& quote, const std::string& item_id);

ReorderPoint compute_reorder_point(const ForecastResult& forecast, int lead_time_days, const EngineConfig& config);

// Returns std::nullopt when on-hand stock is above the reorder point, or when stock on hand
// and in transit already cover the replenishment horizon. Quotes for other items
// are ignored; with no usable quote the suggestion carries no supplier and a
// `missing_supplier` tag.
std::optional<ReorderSuggestion> recommend_reorder(const ForecastResult& forecast,
                                                   const InventoryState& state,
                                                   const std::vector<SupplierQuote>& suppliers,
                                                   const EngineConfig& config);

// Sums every batch of one item into a single stock position for the reorder pass. Lead time,
// supplier and unit cost come from the batch with the latest expiry.
InventoryState consolidate_batches(const std::string& item_id, const std::vector<InventoryState>& batches);

}
