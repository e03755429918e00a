#include <unity.h>

#include "logging.hpp"

void test_aggregate_fills_missing_periods_with_zero();
void test_aggregate_two_periods_is_insufficient();
void test_aggregate_unknown_item_is_insufficient();
void test_aggregate_skips_future_and_negative_records();
void test_weeks_start_on_monday();
void test_monthly_periods_follow_calendar();
void test_weekly_aggregation_sums_days();
void test_group_by_item_splits_records();
void test_forecast_accuracy_metrics();
void test_abc_classes_follow_cumulative_value();
void test_stock_valuation_counts_expired_stock();
void test_turnover_uses_last_year_of_consumption();
void test_spike_after_steady_window_is_high();
void test_severity_bands_follow_z_score();
void test_deviation_from_flat_window_is_high();
void test_flat_series_has_no_anomalies();
void test_series_shorter_than_window_is_not_scored();
void test_consumption_shift_directions();
void test_default_config_is_valid();
void test_set_option_updates_known_key();
void test_set_option_rejects_bad_input_and_keeps_config();
void test_engine_rejects_invalid_config();
void test_forecast_fingerprint_tracks_model_parameters();
void test_cache_reuses_forecast_for_unchanged_series();
void test_cache_misses_when_series_changes();
void test_series_hash_depends_on_values();
void test_run_isolates_failing_items();
void test_run_recommends_reorder_for_flat_demand();
void test_run_uses_supplier_lead_time_when_batches_have_none();
void test_c_api_round_trip();
void test_c_api_interactions();
void test_run_lead_time_fallback_accepts_quotes_for_any_item();
void test_c_api_reports_missing_supplier();
void test_c_api_anomalies_and_snapshot_reset();
void test_c_api_category_rules();
void test_empty_batch_has_no_risk();
void test_zero_demand_batch_is_certain_to_expire();
void test_open_return_window_prefers_return();
void test_partial_shortfall_suggests_discount();
void test_fast_moving_batch_is_safe();
void test_expired_batch_is_fully_at_risk();
void test_periods_until_expiry_uses_forecast_granularity();
void test_linear_trend_is_selected_for_trending_series();
void test_tie_between_candidates_goes_to_linear();
void test_predictions_are_never_negative();
void test_forecast_is_deterministic();
void test_short_series_is_flagged_low_confidence();
void test_series_below_minimum_history_throws();
void test_ensemble_is_skipped_on_short_training_window();
void test_zero_horizon_is_raised_to_one();
void test_validation_switches_to_mae_on_zero_actuals();
void test_seasonal_naive_repeats_last_week();
void test_linear_trend_needs_two_points();
void test_all_candidates_failing_falls_back_to_mean();
void test_failed_refit_falls_back_to_mean();
void test_linear_trend_recovers_slope_and_intercept();
void test_names_are_normalized();
void test_names_starting_with_digits_are_kept();
void test_similarity_of_misspelling();
void test_misspelled_duplicate_does_not_pair_with_itself();
void test_interaction_lookup_is_symmetric();
void test_unknown_names_are_reported();
void test_overall_risk_is_the_worst_pair();
void test_category_rule_applies_without_direct_rule();
void test_substitutes_only_for_moderate_or_worse();
void test_unknown_severity_is_rejected();
void test_prescription_review_flags_severe_pairs();
void test_rule_base_replaces_rules_for_same_pair();
void test_reorder_quantity_covers_horizon_demand();
void test_minimum_order_quantity_raises_order();
void test_stock_above_reorder_point_needs_no_order();
void test_safety_stock_scales_with_lead_time();
void test_weekly_forecast_is_converted_to_daily_demand();
void test_missing_supplier_still_suggests_quantity();
void test_suppliers_are_ranked_by_total_cost();
void test_equal_cost_prefers_shorter_lead_time();
void test_in_transit_stock_reduces_order();
void test_in_transit_stock_covering_horizon_needs_no_order();
void test_long_lead_time_with_horizon_covered_needs_no_order();
void test_zero_forecast_needs_no_order();
void test_quote_without_item_applies_to_every_item();
void test_batches_are_consolidated_per_item();

void setUp() {}
void tearDown() {}

int main(int argc, char** argv) {
    (void)argc;
    (void)argv;
    pharmiq::init_logging(plog::warning);
    UNITY_BEGIN();
    RUN_TEST(test_aggregate_fills_missing_periods_with_zero);
    RUN_TEST(test_aggregate_two_periods_is_insufficient);
    RUN_TEST(test_aggregate_unknown_item_is_insufficient);
    RUN_TEST(test_aggregate_skips_future_and_negative_records);
    RUN_TEST(test_weeks_start_on_monday);
    RUN_TEST(test_monthly_periods_follow_calendar);
    RUN_TEST(test_weekly_aggregation_sums_days);
    RUN_TEST(test_group_by_item_splits_records);
    RUN_TEST(test_forecast_accuracy_metrics);
    RUN_TEST(test_abc_classes_follow_cumulative_value);
    RUN_TEST(test_stock_valuation_counts_expired_stock);
    RUN_TEST(test_turnover_uses_last_year_of_consumption);
    RUN_TEST(test_spike_after_steady_window_is_high);
    RUN_TEST(test_severity_bands_follow_z_score);
    RUN_TEST(test_deviation_from_flat_window_is_high);
    RUN_TEST(test_flat_series_has_no_anomalies);
    RUN_TEST(test_series_shorter_than_window_is_not_scored);
    RUN_TEST(test_consumption_shift_directions);
    RUN_TEST(test_default_config_is_valid);
    RUN_TEST(test_set_option_updates_known_key);
    RUN_TEST(test_set_option_rejects_bad_input_and_keeps_config);
    RUN_TEST(test_engine_rejects_invalid_config);
    RUN_TEST(test_forecast_fingerprint_tracks_model_parameters);
    RUN_TEST(test_cache_reuses_forecast_for_unchanged_series);
    RUN_TEST(test_cache_misses_when_series_changes);
    RUN_TEST(test_series_hash_depends_on_values);
    RUN_TEST(test_run_isolates_failing_items);
    RUN_TEST(test_run_recommends_reorder_for_flat_demand);
    RUN_TEST(test_run_uses_supplier_lead_time_when_batches_have_none);
    RUN_TEST(test_c_api_round_trip);
    RUN_TEST(test_c_api_interactions);
    RUN_TEST(test_run_lead_time_fallback_accepts_quotes_for_any_item);
    RUN_TEST(test_c_api_reports_missing_supplier);
    RUN_TEST(test_c_api_anomalies_and_snapshot_reset);
    RUN_TEST(test_c_api_category_rules);
    RUN_TEST(test_empty_batch_has_no_risk);
    RUN_TEST(test_zero_demand_batch_is_certain_to_expire);
    RUN_TEST(test_open_return_window_prefers_return);
    RUN_TEST(test_partial_shortfall_suggests_discount);
    RUN_TEST(test_fast_moving_batch_is_safe);
    RUN_TEST(test_expired_batch_is_fully_at_risk);
    RUN_TEST(test_periods_until_expiry_uses_forecast_granularity);
    RUN_TEST(test_linear_trend_is_selected_for_trending_series);
    RUN_TEST(test_tie_between_candidates_goes_to_linear);
    RUN_TEST(test_predictions_are_never_negative);
    RUN_TEST(test_forecast_is_deterministic);
    RUN_TEST(test_short_series_is_flagged_low_confidence);
    RUN_TEST(test_series_below_minimum_history_throws);
    RUN_TEST(test_ensemble_is_skipped_on_short_training_window);
    RUN_TEST(test_zero_horizon_is_raised_to_one);
    RUN_TEST(test_validation_switches_to_mae_on_zero_actuals);
    RUN_TEST(test_seasonal_naive_repeats_last_week);
    RUN_TEST(test_linear_trend_needs_two_points);
    RUN_TEST(test_all_candidates_failing_falls_back_to_mean);
    RUN_TEST(test_failed_refit_falls_back_to_mean);
    RUN_TEST(test_linear_trend_recovers_slope_and_intercept);
    RUN_TEST(test_names_are_normalized);
    RUN_TEST(test_names_starting_with_digits_are_kept);
    RUN_TEST(test_similarity_of_misspelling);
    RUN_TEST(test_misspelled_duplicate_does_not_pair_with_itself);
    RUN_TEST(test_interaction_lookup_is_symmetric);
    RUN_TEST(test_unknown_names_are_reported);
    RUN_TEST(test_overall_risk_is_the_worst_pair);
    RUN_TEST(test_category_rule_applies_without_direct_rule);
    RUN_TEST(test_substitutes_only_for_moderate_or_worse);
    RUN_TEST(test_unknown_severity_is_rejected);
    RUN_TEST(test_prescription_review_flags_severe_pairs);
    RUN_TEST(test_rule_base_replaces_rules_for_same_pair);
    RUN_TEST(test_reorder_quantity_covers_horizon_demand);
    RUN_TEST(test_minimum_order_quantity_raises_order);
    RUN_TEST(test_stock_above_reorder_point_needs_no_order);
    RUN_TEST(test_safety_stock_scales_with_lead_time);
    RUN_TEST(test_weekly_forecast_is_converted_to_daily_demand);
    RUN_TEST(test_missing_supplier_still_suggests_quantity);
    RUN_TEST(test_suppliers_are_ranked_by_total_cost);
    RUN_TEST(test_equal_cost_prefers_shorter_lead_time);
    RUN_TEST(test_in_transit_stock_reduces_order);
    RUN_TEST(test_in_transit_stock_covering_horizon_needs_no_order);
    RUN_TEST(test_long_lead_time_with_horizon_covered_needs_no_order);
    RUN_TEST(test_zero_forecast_needs_no_order);
    RUN_TEST(test_quote_without_item_applies_to_every_item);
    RUN_TEST(test_batches_are_consolidated_per_item);
    return UNITY_END();
}
