#include "inventory_analytics.hpp"

#include "periods.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace pharmiq {

ForecastAccuracy forecast_accuracy(const std::vector<double>& predicted, const std::vector<double>& actual) {
    ForecastAccuracy out;
    if (predicted.size() != actual.size() || predicted.empty()) return out;

    const double n = static_cast<double>(predicted.size());
    for (std::size_t i = 0; i < predicted.size(); ++i) {
        const double error = actual[i] - predicted[i];
        const double denom = actual[i] != 0.0 ? actual[i] : 1.0;
        out.mape += std::fabs(error / denom);
        out.mae += std::fabs(error);
        out.mse += error * error;
    }
    out.mape = out.mape / n * 100.0;
    out.mae /= n;
    out.mse /= n;
    out.accuracy = std::max(0.0, 1.0 - out.mape / 100.0);
    return out;
}

std::vector<AbcEntry> abc_classification(const std::vector<InventoryState>& batches) {
    std::map<std::string, double> values;
    double total = 0.0;
    for (const auto& batch : batches) {
        const double value = batch.quantity_on_hand * batch.unit_cost;
        values[batch.item_id] += value;
        total += value;
    }

    std::vector<AbcEntry> entries;
    entries.reserve(values.size());
    for (const auto& [item_id, value] : values) {
        entries.push_back({item_id, value, 0.0, 'C'});
    }
    std::sort(entries.begin(), entries.end(), [](const AbcEntry& a, const AbcEntry& b) {
        if (a.value != b.value) return a.value > b.value;
        return a.item_id < b.item_id;
    });

    double cumulative = 0.0;
    for (auto& entry : entries) {
        cumulative += entry.value;
        entry.cumulative_pct = total > 0.0 ? cumulative / total * 100.0 : 100.0;
        if (entry.cumulative_pct <= 70.0 + 1e-9) {
            entry.abc_class = 'A';
        } else if (entry.cumulative_pct <= 90.0 + 1e-9) {
            entry.abc_class = 'B';
        } else {
            entry.abc_class = 'C';
        }
    }
    return entries;
}

InventoryTurnover inventory_turnover(const std::vector<ConsumptionRecord>& records,
                                     const std::vector<InventoryState>& batches,
                                     std::int64_t now,
                                     const std::optional<std::string>& item_id) {
    InventoryTurnover out;
    std::map<std::string, double> unit_costs;
    for (const auto& batch : batches) {
        if (item_id && batch.item_id != *item_id) continue;
        out.inventory_value += batch.quantity_on_hand * batch.unit_cost;
        unit_costs.emplace(batch.item_id, batch.unit_cost);
    }

    const std::int64_t since = now - 365 * kSecondsPerDay;
    for (const auto& record : records) {
        if (item_id && record.item_id != *item_id) continue;
        if (record.timestamp > now || record.timestamp < since) continue;
        const auto cost = unit_costs.find(record.item_id);
        if (cost == unit_costs.end()) continue;
        out.consumption_value += record.quantity_consumed * cost->second;
    }

    if (out.consumption_value > 0.0 && out.inventory_value > 0.0) {
        out.turnover_ratio = out.consumption_value / out.inventory_value;
        out.days_in_inventory = 365.0 / out.turnover_ratio;
    }
    return out;
}

StockValuation stock_valuation(const std::vector<InventoryState>& batches, std::int64_t as_of_day) {
    StockValuation out;
    std::set<std::string> items;
    for (const auto& batch : batches) {
        const double value = batch.quantity_on_hand * batch.unit_cost;
        out.total_investment += value;
        out.total_units += batch.quantity_on_hand;
        if (batch.expiry_day <= as_of_day) out.expired_value += value;
        items.insert(batch.item_id);
        ++out.batch_count;
    }
    out.item_count = items.size();
    return out;
}

}
