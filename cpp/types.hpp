#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pharmiq {

enum class Granularity {
    DAY,
    WEEK,
    MONTH,
};

struct ConsumptionRecord {
    std::string item_id;
    std::int64_t timestamp;  // epoch seconds, UTC
    double quantity_consumed;
};

struct SeriesPoint {
    std::int64_t period;
    double quantity;
};

struct TimeSeries {
    std::string item_id;
    Granularity granularity = Granularity::DAY;
    std::vector<SeriesPoint> points;

    std::size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }
    std::vector<double> values() const;
    TimeSeries head(std::size_t count) const;
};

struct ForecastResult {
    std::string item_id;
    std::string model_name;
    Granularity granularity = Granularity::DAY;
    std::vector<double> predictions;
    double predicted_quantity_per_period = 0.0;
    double confidence_low = 0.0;
    double confidence_high = 0.0;
    double residual_std_dev = 0.0;
    double error_metric = 0.0;
    std::string error_metric_name;
    bool low_confidence = false;
    std::vector<std::pair<std::string, double>> candidate_errors;
    std::vector<std::string> rationale_tags;
    std::int64_t generated_at = 0;
};

struct InventoryState {
    std::string item_id;
    std::string batch_id;
    double quantity_on_hand = 0.0;
    double quantity_in_transit = 0.0;
    double unit_cost = 0.0;
    std::int64_t expiry_day = 0;  // epoch days
    int lead_time_days = 0;
    std::string supplier_id;
    std::optional<std::int64_t> return_deadline_day;
};

struct SupplierQuote {
    std::string supplier_id;
    std::string item_id;
    double unit_cost = 0.0;
    double fixed_order_cost = 0.0;
    int lead_time_days = 0;
    double minimum_order_quantity = 0.0;
};

struct ReorderSuggestion {
    std::string item_id;
    std::optional<std::string> supplier_id;
    double suggested_quantity = 0.0;
    std::int64_t suggested_order_date = 0;  // epoch days
    double estimated_cost = 0.0;
    double reorder_point = 0.0;
    double safety_stock = 0.0;
    std::optional<double> days_of_cover;
    std::vector<std::string> rationale_tags;
};

enum class ExpiryAction {
    NONE,
    DISCOUNT,
    RETURN_TO_SUPPLIER,
    REDISTRIBUTE,
};

struct ExpiryRiskScore {
    std::string batch_id;
    std::string item_id;
    double risk_probability = 0.0;
    double projected_wastage_quantity = 0.0;
    double periods_until_expiry = 0.0;
    ExpiryAction recommended_action = ExpiryAction::NONE;
    int suggested_discount_pct = 0;
};

enum class AnomalySeverity {
    LOW,
    MEDIUM,
    HIGH,
};

struct AnomalyFlag {
    std::string item_id;
    std::int64_t period;
    double observed;
    double expected;
    double std_dev;
    double z_score;
    AnomalySeverity severity;
};

enum class ShiftDirection {
    INCREASE,
    DECREASE,
};

struct ConsumptionShift {
    std::string item_id;
    double recent_average;
    double previous_average;
    double change_ratio;
    ShiftDirection direction;
};

enum class Severity {
    NONE = 0,
    MINOR = 1,
    MODERATE = 2,
    SEVERE = 3,
};

struct InteractionRule {
    std::string drug_a;
    std::string drug_b;
    Severity severity = Severity::NONE;
    std::string description;
    std::string management;
    std::vector<std::string> substitute_suggestions;
};

struct CategoryRule {
    std::string category_a;
    std::string category_b;
    Severity severity = Severity::NONE;
    std::string description;
    std::string management;
};

struct ResolvedDrug {
    std::string input;
    std::string canonical;
    double similarity;
    bool exact;
};

enum class MatchSource {
    RULE,
    CATEGORY,
};

struct MatchedPair {
    std::string drug_a;
    std::string drug_b;
    Severity severity;
    std::string description;
    std::string management;
    MatchSource source;
    std::vector<std::string> substitute_suggestions;
};

struct InteractionQueryResult {
    std::vector<ResolvedDrug> resolved_inputs;
    std::vector<MatchedPair> matched_pairs;
    std::vector<std::string> unmatched_inputs;
    Severity overall_risk = Severity::NONE;
};

struct PrescriptionReview {
    bool safe = true;
    std::vector<MatchedPair> critical;
    std::vector<MatchedPair> warnings;
    std::vector<std::string> recommendations;
    InteractionQueryResult result;
};

struct ItemFailure {
    std::string item_id;
    std::string stage;
    std::string kind;
    std::string message;
};

struct RunInput {
    std::vector<ConsumptionRecord> records;
    std::vector<InventoryState> batches;
    std::vector<SupplierQuote> suppliers;
    Granularity granularity = Granularity::DAY;
    std::int64_t now = 0;
    std::size_t horizon_periods = 30;
};

struct RunReport {
    std::vector<ForecastResult> forecasts;
    std::vector<AnomalyFlag> anomalies;
    std::vector<ConsumptionShift> shifts;
    std::vector<ReorderSuggestion> reorders;
    std::vector<ExpiryRiskScore> expiry_scores;
    std::vector<ItemFailure> failures;
};

const char* to_string(Granularity granularity);
const char* to_string(ExpiryAction action);
const char* to_string(AnomalySeverity severity);
const char* to_string(ShiftDirection direction);
const char* to_string(Severity severity);
const char* to_string(MatchSource source);

}
