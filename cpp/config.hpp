#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace pharmiq {

struct EngineConfig {
    // aggregation
    std::size_t min_history_periods = 3;

    // forecast selection
    double holdout_fraction = 0.2;
    std::size_t min_splittable_periods = 6;
    double interval_z = 1.28;
    double low_confidence_widening = 2.0;
    std::size_t ensemble_lags = 3;
    std::size_t ensemble_trees = 25;
    std::size_t ensemble_max_depth = 3;
    std::size_t ensemble_min_leaf = 2;
    std::uint32_t random_seed = 42;
    double smoothing_alpha = 0.3;

    // anomaly detection
    std::size_t anomaly_window = 4;
    double low_sigma = 1.5;
    double anomaly_k = 2.0;
    double high_sigma = 3.0;
    std::size_t shift_window = 4;
    double shift_increase_ratio = 1.5;
    double shift_decrease_ratio = 0.5;

    // reorder
    double service_level_z = 1.65;
    double replenishment_horizon_days = 30.0;
    std::size_t max_runner_ups = 2;

    // expiry
    double risk_scale = 1.0;
    double return_threshold = 0.7;
    double discount_threshold = 0.3;
    bool prefer_redistribute = false;

    // interactions
    double fuzzy_threshold = 0.8;

    void validate() const;
    // Hash over the parameters that influence forecast output.
    std::uint64_t forecast_fingerprint() const;
};

// Sets one option by its field name. Throws ConfigurationError for unknown keys or values
// that fail validation; the config is left unchanged in that case.
void set_option(EngineConfig& config, const std::string& key, double value);

}
