#include "anomaly_detector.hpp"

#include <algorithm>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <plog/Log.h>

namespace pharmiq {
namespace {

namespace acc = boost::accumulators;

using WindowStats = acc::accumulator_set<double, acc::stats<acc::tag::mean, acc::tag::variance>>;

double window_mean(const std::vector<SeriesPoint>& points, std::size_t begin, std::size_t end) {
    acc::accumulator_set<double, acc::stats<acc::tag::mean>> stats;
    for (std::size_t i = begin; i < end; ++i) stats(points[i].quantity);
    return acc::mean(stats);
}

}

std::vector<AnomalyFlag> detect_anomalies(const TimeSeries& series, const EngineConfig& config) {
    std::vector<AnomalyFlag> flags;
    const std::size_t window = config.anomaly_window;
    if (series.size() < window + 1) {
        PLOGD << fmt::format("Item '{}': {} period(s), anomaly detection needs {}", series.item_id, series.size(),
                             window + 1);
        return flags;
    }

    for (std::size_t i = window; i < series.size(); ++i) {
        WindowStats stats;
        for (std::size_t j = i - window; j < i; ++j) stats(series.points[j].quantity);

        const double expected = acc::mean(stats);
        const double sigma = std::sqrt(std::max(0.0, acc::variance(stats)));
        const double observed = series.points[i].quantity;
        const double deviation = std::fabs(observed - expected);

        double z = 0.0;
        if (sigma > 0.0) {
            z = deviation / sigma;
        } else if (deviation > 0.0) {
            z = std::numeric_limits<double>::infinity();
        }
        if (!(z > config.low_sigma)) continue;

        AnomalySeverity severity = AnomalySeverity::LOW;
        if (z > config.high_sigma) {
            severity = AnomalySeverity::HIGH;
        } else if (z > config.anomaly_k) {
            severity = AnomalySeverity::MEDIUM;
        }

        flags.push_back({series.item_id, series.points[i].period, observed, expected, sigma, z, severity});
        PLOGD << fmt::format("Item '{}': period {} observed {} expected {:.3f} ({})", series.item_id,
                             series.points[i].period, observed, expected, to_string(severity));
    }
    return flags;
}

std::optional<ConsumptionShift> detect_consumption_shift(const TimeSeries& series, const EngineConfig& config) {
    const std::size_t window = config.shift_window;
    const std::size_t n = series.size();
    if (n < 2 * window) return std::nullopt;

    const double recent = window_mean(series.points, n - window, n);
    const double previous = window_mean(series.points, n - 2 * window, n - window);
    if (recent <= 0.0 || previous <= 0.0) return std::nullopt;

    const double ratio = recent / previous;
    if (ratio > config.shift_increase_ratio) {
        return ConsumptionShift{series.item_id, recent, previous, ratio, ShiftDirection::INCREASE};
    }
    if (ratio < config.shift_decrease_ratio) {
        return ConsumptionShift{series.item_id, recent, previous, ratio, ShiftDirection::DECREASE};
    }
    return std::nullopt;
}

}
