#include "config.hpp"

#include "errors.hpp"

#include <cmath>
#include <fmt/format.h>
#include <functional>
#include <unordered_map>

namespace pharmiq {
namespace {

void require(bool condition, const char* message) {
    if (!condition) throw ConfigurationError(message);
}

std::size_t as_count(const std::string& key, double value) {
    if (value < 0.0 || std::fabs(value - std::round(value)) > 1e-9) {
        throw ConfigurationError(fmt::format("option '{}' requires a non-negative integer", key));
    }
    return static_cast<std::size_t>(std::llround(value));
}

void mix(std::uint64_t& hash, const void* data, std::size_t size) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= bytes[i];
        hash *= 1099511628211ULL;
    }
}

template <typename T>
void mix_value(std::uint64_t& hash, T value) {
    mix(hash, &value, sizeof(value));
}

}

void EngineConfig::validate() const {
    require(min_history_periods >= 1, "min_history_periods must be at least 1");
    require(holdout_fraction > 0.0 && holdout_fraction < 1.0, "holdout_fraction must be in (0, 1)");
    require(min_splittable_periods >= 2, "min_splittable_periods must be at least 2");
    require(interval_z >= 0.0, "interval_z must be non-negative");
    require(low_confidence_widening >= 1.0, "low_confidence_widening must be at least 1");
    require(ensemble_lags >= 1, "ensemble_lags must be at least 1");
    require(ensemble_trees >= 1, "ensemble_trees must be at least 1");
    require(ensemble_min_leaf >= 1, "ensemble_min_leaf must be at least 1");
    require(smoothing_alpha > 0.0 && smoothing_alpha <= 1.0, "smoothing_alpha must be in (0, 1]");
    require(anomaly_window >= 2, "anomaly_window must be at least 2");
    require(low_sigma > 0.0 && low_sigma <= anomaly_k && anomaly_k <= high_sigma,
            "anomaly thresholds must satisfy 0 < low_sigma <= anomaly_k <= high_sigma");
    require(shift_window >= 1, "shift_window must be at least 1");
    require(shift_decrease_ratio > 0.0 && shift_decrease_ratio < 1.0 && shift_increase_ratio > 1.0,
            "shift ratios must bracket 1");
    require(service_level_z >= 0.0, "service_level_z must be non-negative");
    require(replenishment_horizon_days > 0.0, "replenishment_horizon_days must be positive");
    require(risk_scale > 0.0, "risk_scale must be positive");
    require(discount_threshold >= 0.0 && discount_threshold <= return_threshold && return_threshold <= 1.0,
            "expiry thresholds must satisfy 0 <= discount_threshold <= return_threshold <= 1");
    require(fuzzy_threshold > 0.0 && fuzzy_threshold <= 1.0, "fuzzy_threshold must be in (0, 1]");
}

std::uint64_t EngineConfig::forecast_fingerprint() const {
    std::uint64_t hash = 14695981039346656037ULL;
    mix_value(hash, min_history_periods);
    mix_value(hash, holdout_fraction);
    mix_value(hash, min_splittable_periods);
    mix_value(hash, interval_z);
    mix_value(hash, low_confidence_widening);
    mix_value(hash, ensemble_lags);
    mix_value(hash, ensemble_trees);
    mix_value(hash, ensemble_max_depth);
    mix_value(hash, ensemble_min_leaf);
    mix_value(hash, random_seed);
    mix_value(hash, smoothing_alpha);
    return hash;
}

void set_option(EngineConfig& config, const std::string& key, double value) {
    using Setter = std::function<void(EngineConfig&, double)>;
    static const std::unordered_map<std::string, Setter> setters = {
        {"min_history_periods", [](EngineConfig& c, double v) { c.min_history_periods = as_count("min_history_periods", v); }},
        {"holdout_fraction", [](EngineConfig& c, double v) { c.holdout_fraction = v; }},
        {"min_splittable_periods", [](EngineConfig& c, double v) { c.min_splittable_periods = as_count("min_splittable_periods", v); }},
        {"interval_z", [](EngineConfig& c, double v) { c.interval_z = v; }},
        {"low_confidence_widening", [](EngineConfig& c, double v) { c.low_confidence_widening = v; }},
        {"ensemble_lags", [](EngineConfig& c, double v) { c.ensemble_lags = as_count("ensemble_lags", v); }},
        {"ensemble_trees", [](EngineConfig& c, double v) { c.ensemble_trees = as_count("ensemble_trees", v); }},
        {"ensemble_max_depth", [](EngineConfig& c, double v) { c.ensemble_max_depth = as_count("ensemble_max_depth", v); }},
        {"ensemble_min_leaf", [](EngineConfig& c, double v) { c.ensemble_min_leaf = as_count("ensemble_min_leaf", v); }},
        {"random_seed", [](EngineConfig& c, double v) { c.random_seed = static_cast<std::uint32_t>(as_count("random_seed", v)); }},
        {"smoothing_alpha", [](EngineConfig& c, double v) { c.smoothing_alpha = v; }},
        {"anomaly_window", [](EngineConfig& c, double v) { c.anomaly_window = as_count("anomaly_window", v); }},
        {"low_sigma", [](EngineConfig& c, double v) { c.low_sigma = v; }},
        {"anomaly_k", [](EngineConfig& c, double v) { c.anomaly_k = v; }},
        {"high_sigma", [](EngineConfig& c, double v) { c.high_sigma = v; }},
        {"shift_window", [](EngineConfig& c, double v) { c.shift_window = as_count("shift_window", v); }},
        {"shift_increase_ratio", [](EngineConfig& c, double v) { c.shift_increase_ratio = v; }},
        {"shift_decrease_ratio", [](EngineConfig& c, double v) { c.shift_decrease_ratio = v; }},
        {"service_level_z", [](EngineConfig& c, double v) { c.service_level_z = v; }},
        {"replenishment_horizon_days", [](EngineConfig& c, double v) { c.replenishment_horizon_days = v; }},
        {"max_runner_ups", [](EngineConfig& c, double v) { c.max_runner_ups = as_count("max_runner_ups", v); }},
        {"risk_scale", [](EngineConfig& c, double v) { c.risk_scale = v; }},
        {"return_threshold", [](EngineConfig& c, double v) { c.return_threshold = v; }},
        {"discount_threshold", [](EngineConfig& c, double v) { c.discount_threshold = v; }},
        {"prefer_redistribute", [](EngineConfig& c, double v) { c.prefer_redistribute = v != 0.0; }},
        {"fuzzy_threshold", [](EngineConfig& c, double v) { c.fuzzy_threshold = v; }},
    };

    const auto it = setters.find(key);
    if (it == setters.end()) {
        throw ConfigurationError(fmt::format("unknown option '{}'", key));
    }

    EngineConfig candidate = config;
    it->second(candidate, value);
    candidate.validate();
    config = candidate;
}

}
