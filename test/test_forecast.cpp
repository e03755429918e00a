#include <unity.h>

#include "errors.hpp"
#include "forecast_models.hpp"
#include "forecast_selector.hpp"
#include "test_support.hpp"

#include <cmath>
#include <memory>

using namespace pharmiq;
using namespace test_support;

namespace {

class FailingModel : public ForecastModel {
public:
    explicit FailingModel(std::string name, std::size_t max_fit_length = 0)
        : name_(std::move(name)), max_fit_length_(max_fit_length) {}

    std::string name() const override { return name_; }
    void fit(const TimeSeries& series) override {
        if (series.size() > max_fit_length_) throw ComputationError("cannot fit");
    }
    std::vector<double> predict(std::size_t horizon) const override { return std::vector<double>(horizon, 1.0); }

private:
    std::string name_;
    std::size_t max_fit_length_;
};

std::vector<std::unique_ptr<ForecastModel>> failing_candidates(const EngineConfig&) {
    std::vector<std::unique_ptr<ForecastModel>> models;
    models.push_back(std::make_unique<FailingModel>("first"));
    models.push_back(std::make_unique<FailingModel>("second"));
    models.push_back(std::make_unique<FailingModel>("third"));
    return models;
}

std::size_t count_tags(const std::vector<std::string>& tags, const std::string& prefix) {
    std::size_t count = 0;
    for (const auto& tag : tags) {
        if (tag.compare(0, prefix.size(), prefix) == 0) ++count;
    }
    return count;
}

std::vector<double> linear_values(std::size_t n, double start, double step) {
    std::vector<double> values;
    for (std::size_t i = 0; i < n; ++i) values.push_back(start + step * static_cast<double>(i));
    return values;
}

}

void test_linear_trend_is_selected_for_trending_series() {
    const auto series = daily_series("amox", linear_values(20, 10.0, 2.0));

    const auto result = select_forecast("amox", series, 5, noon_of(kDay0 + 19), EngineConfig{});

    TEST_ASSERT_EQUAL_STRING("linear", result.model_name.c_str());
    TEST_ASSERT_EQUAL_STRING("mape", result.error_metric_name.c_str());
    TEST_ASSERT_EQUAL_UINT(5, result.predictions.size());
    TEST_ASSERT_FLOAT_WITHIN(1e-3, 54.0, result.predicted_quantity_per_period);
    TEST_ASSERT_FALSE(result.low_confidence);
    TEST_ASSERT_EQUAL_UINT(3, result.candidate_errors.size());
    TEST_ASSERT_TRUE(has_tag(result.rationale_tags, "selected:linear"));
}

void test_tie_between_candidates_goes_to_linear() {
    const auto series = daily_series("amox", std::vector<double>(30, 20.0));

    const auto result = select_forecast("amox", series, 30, noon_of(kDay0 + 29), EngineConfig{});

    TEST_ASSERT_EQUAL_STRING("linear", result.model_name.c_str());
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 20.0, result.predicted_quantity_per_period);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 0.0, result.residual_std_dev);
}

void test_predictions_are_never_negative() {
    const auto series = daily_series("amox", linear_values(20, 100.0, -5.0));

    const auto result = select_forecast("amox", series, 40, noon_of(kDay0 + 19), EngineConfig{});

    for (double p : result.predictions) TEST_ASSERT_TRUE(p >= 0.0);
    TEST_ASSERT_TRUE(result.confidence_low >= 0.0);
    TEST_ASSERT_TRUE(result.confidence_low <= result.predicted_quantity_per_period);
    TEST_ASSERT_TRUE(result.confidence_high >= result.predicted_quantity_per_period);
}

void test_forecast_is_deterministic() {
    const auto series = daily_series("amox", {12, 15, 9, 14, 20, 11, 13, 16, 10, 18, 14, 12, 19, 15, 11, 17});
    const EngineConfig config;

    const auto first = select_forecast("amox", series, 7, noon_of(kDay0 + 15), config);
    const auto second = select_forecast("amox", series, 7, noon_of(kDay0 + 15), config);

    TEST_ASSERT_EQUAL_STRING(first.model_name.c_str(), second.model_name.c_str());
    TEST_ASSERT_EQUAL_UINT(first.predictions.size(), second.predictions.size());
    for (std::size_t i = 0; i < first.predictions.size(); ++i) {
        TEST_ASSERT_TRUE(first.predictions[i] == second.predictions[i]);
    }
    TEST_ASSERT_TRUE(first.confidence_low == second.confidence_low);
    TEST_ASSERT_TRUE(first.confidence_high == second.confidence_high);
}

void test_short_series_is_flagged_low_confidence() {
    const auto series = daily_series("amox", {10.0, 14.0, 12.0, 16.0});

    const auto result = select_forecast("amox", series, 3, noon_of(kDay0 + 3), EngineConfig{});

    TEST_ASSERT_TRUE(result.low_confidence);
    TEST_ASSERT_EQUAL_STRING("seasonal", result.model_name.c_str());
    TEST_ASSERT_TRUE(has_tag(result.rationale_tags, "insufficient_history_for_selection"));
    TEST_ASSERT_TRUE(has_tag(result.rationale_tags, "seasonal:exponential_smoothing"));
    TEST_ASSERT_TRUE(result.candidate_errors.empty());
}

void test_series_below_minimum_history_throws() {
    const auto series = daily_series("amox", {10.0, 14.0});
    TEST_ASSERT_TRUE(throws<InsufficientDataError>(
        [&] { select_forecast("amox", series, 3, noon_of(kDay0 + 1), EngineConfig{}); }));
}

void test_ensemble_is_skipped_on_short_training_window() {
    const auto series = daily_series("amox", {10.0, 14.0, 12.0, 16.0, 13.0, 15.0});

    const auto result = select_forecast("amox", series, 3, noon_of(kDay0 + 5), EngineConfig{});

    TEST_ASSERT_TRUE(has_tag(result.rationale_tags, "skipped:ensemble"));
    TEST_ASSERT_EQUAL_UINT(2, result.candidate_errors.size());
}

void test_zero_horizon_is_raised_to_one() {
    const auto series = daily_series("amox", std::vector<double>(10, 4.0));

    const auto result = select_forecast("amox", series, 0, noon_of(kDay0 + 9), EngineConfig{});

    TEST_ASSERT_EQUAL_UINT(1, result.predictions.size());
}

void test_validation_switches_to_mae_on_zero_actuals() {
    const auto with_zero = score_predictions({2.0, 4.0}, {0.0, 6.0});
    TEST_ASSERT_EQUAL_STRING("mae", with_zero.metric.c_str());
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 2.0, with_zero.error);

    const auto nonzero = score_predictions({9.0, 22.0}, {10.0, 20.0});
    TEST_ASSERT_EQUAL_STRING("mape", nonzero.metric.c_str());
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 10.0, nonzero.error);
}

void test_seasonal_naive_repeats_last_week() {
    const std::vector<double> week = {1, 2, 3, 4, 5, 6, 7};
    std::vector<double> values;
    for (int i = 0; i < 3; ++i) values.insert(values.end(), week.begin(), week.end());

    SeasonalModel model(0.3);
    model.fit(daily_series("amox", values));
    const auto predictions = model.predict(9);

    TEST_ASSERT_TRUE(model.is_seasonal_naive());
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 1.0, predictions[0]);
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 7.0, predictions[6]);
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 2.0, predictions[8]);
}

void test_linear_trend_needs_two_points() {
    LinearTrendModel model;
    TEST_ASSERT_TRUE(throws<ComputationError>([&] { model.fit(daily_series("amox", {3.0})); }));
}

void test_all_candidates_failing_falls_back_to_mean() {
    const auto series = daily_series("amox", {10, 14, 12, 16, 18, 20, 12, 18, 10, 20});

    const auto result = select_forecast("amox", series, 4, noon_of(kDay0 + 9), EngineConfig{}, failing_candidates);

    TEST_ASSERT_TRUE(result.low_confidence);
    TEST_ASSERT_EQUAL_UINT(4, result.predictions.size());
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 15.0, result.predicted_quantity_per_period);
    TEST_ASSERT_EQUAL_UINT(3, count_tags(result.rationale_tags, "skipped:"));
    TEST_ASSERT_TRUE(has_tag(result.rationale_tags, "skipped:first:cannot fit"));
    TEST_ASSERT_TRUE(has_tag(result.rationale_tags, "all_candidates_failed"));
    TEST_ASSERT_TRUE(result.candidate_errors.empty());
    TEST_ASSERT_TRUE(result.confidence_low <= 15.0);
    TEST_ASSERT_TRUE(result.confidence_high > 15.0);
}

void test_failed_refit_falls_back_to_mean() {
    const auto series = daily_series("amox", {10, 14, 12, 16, 18, 20, 12, 18, 10, 20});
    const CandidateFactory train_only = [](const EngineConfig&) {
        std::vector<std::unique_ptr<ForecastModel>> models;
        models.push_back(std::make_unique<FailingModel>("train_only", 8));
        return models;
    };

    const auto result = select_forecast("amox", series, 2, noon_of(kDay0 + 9), EngineConfig{}, train_only);

    TEST_ASSERT_EQUAL_UINT(1, result.candidate_errors.size());
    TEST_ASSERT_TRUE(has_tag(result.rationale_tags, "skipped:train_only"));
    TEST_ASSERT_TRUE(has_tag(result.rationale_tags, "all_candidates_failed"));
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 15.0, result.predicted_quantity_per_period);
}

void test_linear_trend_recovers_slope_and_intercept() {
    LinearTrendModel model;
    model.fit(daily_series("amox", linear_values(12, 4.0, 1.5)));

    TEST_ASSERT_FLOAT_WITHIN(1e-6, 4.0, model.intercept());
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 1.5, model.slope());
    TEST_ASSERT_FLOAT_WITHIN(1e-6, 22.0, model.predict(1)[0]);
}
