#include <unity.h>

#include "anomaly_detector.hpp"
#include "test_support.hpp"

#include <cmath>

using namespace pharmiq;
using namespace test_support;

void test_spike_after_steady_window_is_high() {
    const auto series = daily_series("amox", {10.0, 12.0, 11.0, 13.0, 50.0});

    const auto flags = detect_anomalies(series, EngineConfig{});

    TEST_ASSERT_EQUAL_UINT(1, flags.size());
    TEST_ASSERT_EQUAL_INT64(kDay0 + 4, flags[0].period);
    TEST_ASSERT_TRUE(flags[0].severity == AnomalySeverity::HIGH);
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 11.5, flags[0].expected);
    TEST_ASSERT_FLOAT_WITHIN(1e-6, std::sqrt(1.25), flags[0].std_dev);
    TEST_ASSERT_TRUE(flags[0].z_score > 3.0);
}

void test_severity_bands_follow_z_score() {
    // Window mean 11, population sigma 1.
    const auto medium = detect_anomalies(daily_series("amox", {10.0, 12.0, 10.0, 12.0, 13.5}), EngineConfig{});
    TEST_ASSERT_EQUAL_UINT(1, medium.size());
    TEST_ASSERT_TRUE(medium[0].severity == AnomalySeverity::MEDIUM);

    const auto low = detect_anomalies(daily_series("amox", {10.0, 12.0, 10.0, 12.0, 9.2}), EngineConfig{});
    TEST_ASSERT_EQUAL_UINT(1, low.size());
    TEST_ASSERT_TRUE(low[0].severity == AnomalySeverity::LOW);

    const auto none = detect_anomalies(daily_series("amox", {10.0, 12.0, 10.0, 12.0, 12.0}), EngineConfig{});
    TEST_ASSERT_EQUAL_UINT(0, none.size());
}

void test_deviation_from_flat_window_is_high() {
    const auto flags = detect_anomalies(daily_series("amox", {5.0, 5.0, 5.0, 5.0, 6.0}), EngineConfig{});

    TEST_ASSERT_EQUAL_UINT(1, flags.size());
    TEST_ASSERT_TRUE(flags[0].severity == AnomalySeverity::HIGH);
    TEST_ASSERT_TRUE(std::isinf(flags[0].z_score));
}

void test_flat_series_has_no_anomalies() {
    const auto flags = detect_anomalies(daily_series("amox", std::vector<double>(12, 7.0)), EngineConfig{});
    TEST_ASSERT_EQUAL_UINT(0, flags.size());
}

void test_series_shorter_than_window_is_not_scored() {
    const auto flags = detect_anomalies(daily_series("amox", {1.0, 100.0, 1.0, 100.0}), EngineConfig{});
    TEST_ASSERT_EQUAL_UINT(0, flags.size());
}

void test_consumption_shift_directions() {
    const EngineConfig config;

    const auto up = detect_consumption_shift(daily_series("amox", {10, 10, 10, 10, 20, 20, 20, 20}), config);
    TEST_ASSERT_TRUE(up.has_value());
    TEST_ASSERT_TRUE(up->direction == ShiftDirection::INCREASE);
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 2.0, up->change_ratio);

    const auto down = detect_consumption_shift(daily_series("amox", {20, 20, 20, 20, 8, 8, 8, 8}), config);
    TEST_ASSERT_TRUE(down.has_value());
    TEST_ASSERT_TRUE(down->direction == ShiftDirection::DECREASE);

    const auto steady = detect_consumption_shift(daily_series("amox", {10, 11, 10, 11, 12, 11, 12, 11}), config);
    TEST_ASSERT_FALSE(steady.has_value());

    const auto short_series = detect_consumption_shift(daily_series("amox", {10, 30, 10}), config);
    TEST_ASSERT_FALSE(short_series.has_value());
}
