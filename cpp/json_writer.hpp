#pragma once

#include "inventory_analytics.hpp"
#include "types.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace pharmiq {

std::string json_escape(const std::string& s);

void write_json(std::ostream& out, const ForecastResult& forecast);
void write_json(std::ostream& out, const AnomalyFlag& flag);
void write_json(std::ostream& out, const ConsumptionShift& shift);
void write_json(std::ostream& out, const ReorderSuggestion& suggestion);
void write_json(std::ostream& out, const ExpiryRiskScore& score);
void write_json(std::ostream& out, const ItemFailure& failure);
void write_json(std::ostream& out, const MatchedPair& pair);
void write_json(std::ostream& out, const InteractionQueryResult& result);
void write_json(std::ostream& out, const PrescriptionReview& review);
void write_json(std::ostream& out, const RunReport& report);
void write_json(std::ostream& out, const StockValuation& valuation);
void write_json(std::ostream& out, const AbcEntry& entry);
void write_json(std::ostream& out, const InventoryTurnover& turnover);

template <typename T>
void write_json(std::ostream& out, const std::vector<T>& values) {
    out << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ",";
        write_json(out, values[i]);
    }
    out << "]";
}

std::string error_json(const std::string& kind, const std::string& message);

}
