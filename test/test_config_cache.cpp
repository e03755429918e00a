#include <unity.h>

#include "config.hpp"
#include "errors.hpp"
#include "forecast_cache.hpp"
#include "inventory_engine.hpp"
#include "test_support.hpp"

using namespace pharmiq;
using namespace test_support;

void test_default_config_is_valid() {
    const EngineConfig config;
    config.validate();
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 1.65, config.service_level_z);
    TEST_ASSERT_EQUAL_UINT(4, config.anomaly_window);
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 0.8, config.fuzzy_threshold);
}

void test_set_option_updates_known_key() {
    EngineConfig config;
    set_option(config, "service_level_z", 2.33);
    set_option(config, "ensemble_trees", 10);
    set_option(config, "prefer_redistribute", 1);

    TEST_ASSERT_FLOAT_WITHIN(1e-9, 2.33, config.service_level_z);
    TEST_ASSERT_EQUAL_UINT(10, config.ensemble_trees);
    TEST_ASSERT_TRUE(config.prefer_redistribute);
}

void test_set_option_rejects_bad_input_and_keeps_config() {
    EngineConfig config;

    TEST_ASSERT_TRUE(throws<ConfigurationError>([&] { set_option(config, "no_such_option", 1.0); }));
    TEST_ASSERT_TRUE(throws<ConfigurationError>([&] { set_option(config, "holdout_fraction", 1.5); }));
    TEST_ASSERT_TRUE(throws<ConfigurationError>([&] { set_option(config, "anomaly_window", 2.5); }));
    TEST_ASSERT_TRUE(throws<ConfigurationError>([&] { set_option(config, "high_sigma", 1.0); }));

    TEST_ASSERT_FLOAT_WITHIN(1e-9, 0.2, config.holdout_fraction);
    TEST_ASSERT_EQUAL_UINT(4, config.anomaly_window);
    TEST_ASSERT_FLOAT_WITHIN(1e-9, 3.0, config.high_sigma);
}

void test_engine_rejects_invalid_config() {
    EngineConfig config;
    config.return_threshold = 0.2;
    config.discount_threshold = 0.5;
    TEST_ASSERT_TRUE(throws<ConfigurationError>([&] { InventoryEngine engine(config); }));
}

void test_forecast_fingerprint_tracks_model_parameters() {
    EngineConfig a;
    EngineConfig b;
    TEST_ASSERT_TRUE(a.forecast_fingerprint() == b.forecast_fingerprint());

    b.service_level_z = 2.0;
    TEST_ASSERT_TRUE(a.forecast_fingerprint() == b.forecast_fingerprint());

    b.random_seed = 7;
    TEST_ASSERT_FALSE(a.forecast_fingerprint() == b.forecast_fingerprint());
}

void test_cache_reuses_forecast_for_unchanged_series() {
    const InventoryEngine engine;
    ForecastCache cache;
    const auto series = daily_series("amox", {12, 15, 9, 14, 20, 11, 13, 16, 10, 18});

    const auto first = engine.forecast("amox", series, 7, noon_of(kDay0 + 9), &cache);
    const auto second = engine.forecast("amox", series, 7, noon_of(kDay0 + 10), &cache);

    TEST_ASSERT_EQUAL_UINT(1, cache.size());
    TEST_ASSERT_EQUAL_UINT(1, cache.hits());
    TEST_ASSERT_EQUAL_UINT(1, cache.misses());
    TEST_ASSERT_EQUAL_STRING(first.model_name.c_str(), second.model_name.c_str());
    TEST_ASSERT_TRUE(first.predictions == second.predictions);
    TEST_ASSERT_EQUAL_INT64(noon_of(kDay0 + 10), second.generated_at);
}

void test_cache_misses_when_series_changes() {
    const InventoryEngine engine;
    ForecastCache cache;
    auto series = daily_series("amox", {12, 15, 9, 14, 20, 11, 13, 16, 10, 18});

    engine.forecast("amox", series, 7, noon_of(kDay0 + 9), &cache);
    series.points.back().quantity = 19.0;
    engine.forecast("amox", series, 7, noon_of(kDay0 + 9), &cache);

    TEST_ASSERT_EQUAL_UINT(2, cache.size());
    TEST_ASSERT_EQUAL_UINT(0, cache.hits());

    cache.invalidate("amox");
    TEST_ASSERT_EQUAL_UINT(0, cache.size());
}

void test_series_hash_depends_on_values() {
    auto series = daily_series("amox", {1.0, 2.0, 3.0});
    const auto before = hash_series(series);
    series.points[1].quantity = 2.5;
    TEST_ASSERT_FALSE(before == hash_series(series));

    const auto key_a = make_cache_key("amox", series, 7, EngineConfig{});
    const auto key_b = make_cache_key("amox", series, 14, EngineConfig{});
    TEST_ASSERT_FALSE(key_a == key_b);
}
