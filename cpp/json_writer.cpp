#include "json_writer.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace pharmiq {
namespace {

void write_number(std::ostream& out, double value) {
    if (std::isfinite(value)) {
        out << std::fixed << std::setprecision(6) << value;
    } else {
        out << "null";
    }
}

void write_string(std::ostream& out, const std::string& value) {
    out << "\"" << json_escape(value) << "\"";
}

void write_strings(std::ostream& out, const std::vector<std::string>& values) {
    out << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ",";
        write_string(out, values[i]);
    }
    out << "]";
}

}

std::string json_escape(const std::string& s) {
    std::ostringstream out;
    for (unsigned char c : s) {
        switch (c) {
            case '"':
                out << "\\\"";
                break;
            case '\\':
                out << "\\\\";
                break;
            case '\b':
                out << "\\b";
                break;
            case '\f':
                out << "\\f";
                break;
            case '\n':
                out << "\\n";
                break;
            case '\r':
                out << "\\r";
                break;
            case '\t':
                out << "\\t";
                break;
            default:
                if (c < 0x20) {
                    out << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::nouppercase << std::dec;
                } else {
                    out << static_cast<char>(c);
                }
                break;
        }
    }
    return out.str();
}

void write_json(std::ostream& out, const ForecastResult& forecast) {
    out << "{\"item_id\":";
    write_string(out, forecast.item_id);
    out << ",\"model_name\":";
    write_string(out, forecast.model_name);
    out << ",\"granularity\":\"" << to_string(forecast.granularity) << "\",\"predicted_quantity_per_period\":";
    write_number(out, forecast.predicted_quantity_per_period);
    out << ",\"predictions\":[";
    for (std::size_t i = 0; i < forecast.predictions.size(); ++i) {
        if (i > 0) out << ",";
        write_number(out, forecast.predictions[i]);
    }
    out << "],\"confidence_interval\":[";
    write_number(out, forecast.confidence_low);
    out << ",";
    write_number(out, forecast.confidence_high);
    out << "],\"residual_std_dev\":";
    write_number(out, forecast.residual_std_dev);
    out << ",\"error_metric\":";
    write_number(out, forecast.error_metric);
    out << ",\"error_metric_name\":";
    write_string(out, forecast.error_metric_name);
    out << ",\"low_confidence\":" << (forecast.low_confidence ? "true" : "false") << ",\"candidate_errors\":{";
    for (std::size_t i = 0; i < forecast.candidate_errors.size(); ++i) {
        if (i > 0) out << ",";
        write_string(out, forecast.candidate_errors[i].first);
        out << ":";
        write_number(out, forecast.candidate_errors[i].second);
    }
    out << "},\"rationale_tags\":";
    write_strings(out, forecast.rationale_tags);
    out << ",\"generated_at\":" << forecast.generated_at << "}";
}

void write_json(std::ostream& out, const AnomalyFlag& flag) {
    out << "{\"item_id\":";
    write_string(out, flag.item_id);
    out << ",\"period\":" << flag.period << ",\"observed\":";
    write_number(out, flag.observed);
    out << ",\"expected\":";
    write_number(out, flag.expected);
    out << ",\"std_dev\":";
    write_number(out, flag.std_dev);
    out << ",\"z_score\":";
    write_number(out, flag.z_score);
    out << ",\"severity\":\"" << to_string(flag.severity) << "\"}";
}

void write_json(std::ostream& out, const ConsumptionShift& shift) {
    out << "{\"item_id\":";
    write_string(out, shift.item_id);
    out << ",\"recent_average\":";
    write_number(out, shift.recent_average);
    out << ",\"previous_average\":";
    write_number(out, shift.previous_average);
    out << ",\"change_ratio\":";
    write_number(out, shift.change_ratio);
    out << ",\"direction\":\"" << to_string(shift.direction) << "\"}";
}

void write_json(std::ostream& out, const ReorderSuggestion& suggestion) {
    out << "{\"item_id\":";
    write_string(out, suggestion.item_id);
    out << ",\"supplier_id\":";
    write_string(out, suggestion.supplier_id.value_or("none"));
    out << ",\"suggested_quantity\":";
    write_number(out, suggestion.suggested_quantity);
    out << ",\"suggested_order_date\":" << suggestion.suggested_order_date << ",\"estimated_cost\":";
    write_number(out, suggestion.estimated_cost);
    out << ",\"reorder_point\":";
    write_number(out, suggestion.reorder_point);
    out << ",\"safety_stock\":";
    write_number(out, suggestion.safety_stock);
    out << ",\"days_of_cover\":";
    if (suggestion.days_of_cover) {
        write_number(out, *suggestion.days_of_cover);
    } else {
        out << "null";
    }
    out << ",\"rationale_tags\":";
    write_strings(out, suggestion.rationale_tags);
    out << "}";
}

void write_json(std::ostream& out, const ExpiryRiskScore& score) {
    out << "{\"batch_id\":";
    write_string(out, score.batch_id);
    out << ",\"item_id\":";
    write_string(out, score.item_id);
    out << ",\"risk_probability\":";
    write_number(out, score.risk_probability);
    out << ",\"projected_wastage_quantity\":";
    write_number(out, score.projected_wastage_quantity);
    out << ",\"periods_until_expiry\":";
    write_number(out, score.periods_until_expiry);
    out << ",\"recommended_action\":\"" << to_string(score.recommended_action)
        << "\",\"suggested_discount_pct\":" << score.suggested_discount_pct << "}";
}

void write_json(std::ostream& out, const ItemFailure& failure) {
    out << "{\"item_id\":";
    write_string(out, failure.item_id);
    out << ",\"stage\":";
    write_string(out, failure.stage);
    out << ",\"kind\":";
    write_string(out, failure.kind);
    out << ",\"message\":";
    write_string(out, failure.message);
    out << "}";
}

void write_json(std::ostream& out, const MatchedPair& pair) {
    out << "{\"drug_a\":";
    write_string(out, pair.drug_a);
    out << ",\"drug_b\":";
    write_string(out, pair.drug_b);
    out << ",\"severity\":\"" << to_string(pair.severity) << "\",\"description\":";
    write_string(out, pair.description);
    out << ",\"management\":";
    write_string(out, pair.management);
    out << ",\"source\":\"" << to_string(pair.source) << "\",\"substitute_suggestions\":";
    write_strings(out, pair.substitute_suggestions);
    out << "}";
}

void write_json(std::ostream& out, const InteractionQueryResult& result) {
    out << "{\"resolved_inputs\":[";
    for (std::size_t i = 0; i < result.resolved_inputs.size(); ++i) {
        const auto& r = result.resolved_inputs[i];
        if (i > 0) out << ",";
        out << "{\"input\":";
        write_string(out, r.input);
        out << ",\"canonical\":";
        write_string(out, r.canonical);
        out << ",\"similarity\":";
        write_number(out, r.similarity);
        out << ",\"exact\":" << (r.exact ? "true" : "false") << "}";
    }
    out << "],\"matched_pairs\":";
    write_json(out, result.matched_pairs);
    out << ",\"unmatched_inputs\":";
    write_strings(out, result.unmatched_inputs);
    out << ",\"overall_risk\":\"" << to_string(result.overall_risk) << "\"}";
}

void write_json(std::ostream& out, const PrescriptionReview& review) {
    out << "{\"safe\":" << (review.safe ? "true" : "false") << ",\"critical\":";
    write_json(out, review.critical);
    out << ",\"warnings\":";
    write_json(out, review.warnings);
    out << ",\"recommendations\":";
    write_strings(out, review.recommendations);
    out << ",\"result\":";
    write_json(out, review.result);
    out << "}";
}

void write_json(std::ostream& out, const RunReport& report) {
    out << "{\"success\":true,\"forecasts\":";
    write_json(out, report.forecasts);
    out << ",\"anomalies\":";
    write_json(out, report.anomalies);
    out << ",\"shifts\":";
    write_json(out, report.shifts);
    out << ",\"reorders\":";
    write_json(out, report.reorders);
    out << ",\"expiry_scores\":";
    write_json(out, report.expiry_scores);
    out << ",\"failures\":";
    write_json(out, report.failures);
    out << "}";
}

void write_json(std::ostream& out, const StockValuation& valuation) {
    out << "{\"total_investment\":";
    write_number(out, valuation.total_investment);
    out << ",\"total_units\":";
    write_number(out, valuation.total_units);
    out << ",\"expired_value\":";
    write_number(out, valuation.expired_value);
    out << ",\"item_count\":" << valuation.item_count << ",\"batch_count\":" << valuation.batch_count << "}";
}

void write_json(std::ostream& out, const AbcEntry& entry) {
    out << "{\"item_id\":";
    write_string(out, entry.item_id);
    out << ",\"value\":";
    write_number(out, entry.value);
    out << ",\"cumulative_pct\":";
    write_number(out, entry.cumulative_pct);
    out << ",\"abc_class\":\"" << entry.abc_class << "\"}";
}

void write_json(std::ostream& out, const InventoryTurnover& turnover) {
    out << "{\"turnover_ratio\":";
    write_number(out, turnover.turnover_ratio);
    out << ",\"days_in_inventory\":";
    write_number(out, turnover.days_in_inventory);
    out << ",\"consumption_value\":";
    write_number(out, turnover.consumption_value);
    out << ",\"inventory_value\":";
    write_number(out, turnover.inventory_value);
    out << "}";
}

std::string error_json(const std::string& kind, const std::string& message) {
    std::ostringstream out;
    out << "{\"success\":false,\"error\":";
    write_string(out, message);
    out << ",\"kind\":";
    write_string(out, kind);
    out << "}";
    return out.str();
}

}
