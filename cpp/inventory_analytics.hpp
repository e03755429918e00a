#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pharmiq {

struct ForecastAccuracy {
    double mape = 0.0;  // percent; zero actuals are divided by 1
    double mae = 0.0;
    double mse = 0.0;
    double accuracy = 0.0;
};

// All zero when the inputs are empty or of different length.
ForecastAccuracy forecast_accuracy(const std::vector<double>& predicted, const std::vector<double>& actual);

struct AbcEntry {
    std::string item_id;
    double value;
    double cumulative_pct;
    char abc_class;
};

// Ranks items by stock value (on hand x unit cost, summed over batches). Items within the first
// 70% of cumulative value are A, up to 90% B, the rest C.
std::vector<AbcEntry> abc_classification(const std::vector<InventoryState>& batches);

struct InventoryTurnover {
    double turnover_ratio = 0.0;
    double days_in_inventory = 365.0;
    double consumption_value = 0.0;
    double inventory_value = 0.0;
};

// Consumption value over the 365 days before `now` against current stock value, for one item
// or for everything when `item_id` is empty.
InventoryTurnover inventory_turnover(const std::vector<ConsumptionRecord>& records,
                                     const std::vector<InventoryState>& batches,
                                     std::int64_t now,
                                     const std::optional<std::string>& item_id = std::nullopt);

struct StockValuation {
    double total_investment = 0.0;
    double total_units = 0.0;
    double expired_value = 0.0;
    std::size_t item_count = 0;
    std::size_t batch_count = 0;
};

StockValuation stock_valuation(const std::vector<InventoryState>& batches, std::int64_t as_of_day);

}
