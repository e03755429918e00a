#include "forecast_selector.hpp"

#include "errors.hpp"
#include "forecast_models.hpp"

#include <algorithm>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/moment.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <plog/Log.h>

namespace pharmiq {
namespace {

namespace acc = boost::accumulators;

double root_mean_square(const std::vector<double>& residuals) {
    acc::accumulator_set<double, acc::stats<acc::tag::moment<2>>> stats;
    for (double r : residuals) stats(r);
    return residuals.empty() ? 0.0 : std::sqrt(acc::moment<2>(stats));
}

struct SeriesSpread {
    double mean;
    double std_dev;
};

SeriesSpread spread_of(const std::vector<double>& values) {
    acc::accumulator_set<double, acc::stats<acc::tag::mean, acc::tag::variance>> stats;
    for (double v : values) stats(v);
    return {acc::mean(stats), std::sqrt(std::max(0.0, acc::variance(stats)))};
}

void finish(ForecastResult& result, std::vector<double> predictions, double sigma, double interval_z) {
    for (auto& p : predictions) p = std::max(0.0, p);
    double total = 0.0;
    for (double p : predictions) total += p;
    result.predicted_quantity_per_period = predictions.empty() ? 0.0 : total / static_cast<double>(predictions.size());
    result.predictions = std::move(predictions);
    result.residual_std_dev = sigma;
    result.confidence_low = std::max(0.0, result.predicted_quantity_per_period - interval_z * sigma);
    result.confidence_high = std::max(0.0, result.predicted_quantity_per_period + interval_z * sigma);
}

void fallback_to_mean(ForecastResult& result, const std::vector<double>& values, std::size_t horizon,
                      const EngineConfig& config) {
    const auto spread = spread_of(values);
    result.model_name = "seasonal";
    result.low_confidence = true;
    result.error_metric = 0.0;
    result.error_metric_name = "none";
    result.rationale_tags.push_back("all_candidates_failed");
    result.rationale_tags.push_back("seasonal:mean");
    finish(result, std::vector<double>(horizon, spread.mean), spread.std_dev,
           config.interval_z * config.low_confidence_widening);
}

}

ForecastResult select_forecast(const std::string& item_id,
                               const TimeSeries& series,
                               std::size_t horizon,
                               std::int64_t generated_at,
                               const EngineConfig& config,
                               const CandidateFactory& make_models) {
    const std::size_t n = series.size();
    if (n < config.min_history_periods) {
        throw InsufficientDataError(fmt::format("item '{}' has {} period(s) of history, {} required", item_id, n,
                                                config.min_history_periods));
    }
    if (horizon == 0) {
        PLOG_WARNING << fmt::format("Item '{}': forecast horizon 0 raised to 1", item_id);
        horizon = 1;
    }

    ForecastResult result;
    result.item_id = item_id;
    result.granularity = series.granularity;
    result.generated_at = generated_at;
    const auto values = series.values();

    if (n < config.min_splittable_periods) {
        SeasonalModel model(config.smoothing_alpha);
        model.fit(series);
        result.model_name = model.name();
        result.low_confidence = true;
        result.error_metric_name = "none";
        result.rationale_tags.push_back("insufficient_history_for_selection");
        for (auto& note : model.notes()) result.rationale_tags.push_back(note);
        finish(result, model.predict(horizon), spread_of(values).std_dev,
               config.interval_z * config.low_confidence_widening);
        PLOGD << fmt::format("Item '{}': {} periods, skipped model comparison", item_id, n);
        return result;
    }

    const auto holdout_size =
        std::max<std::size_t>(1, static_cast<std::size_t>(std::floor(config.holdout_fraction * static_cast<double>(n))));
    const TimeSeries train = series.head(n - holdout_size);
    TimeSeries holdout{series.item_id, series.granularity, {}};
    holdout.points.assign(series.points.end() - static_cast<std::ptrdiff_t>(holdout_size), series.points.end());

    auto candidates = make_models(config);
    ForecastModel* best = nullptr;
    ValidationScore best_score;
    double best_error = std::numeric_limits<double>::infinity();

    for (auto& candidate : candidates) {
        try {
            candidate->fit(train);
            auto score = candidate->validation_error(holdout);
            if (!std::isfinite(score.error)) {
                throw ComputationError("validation error is not finite");
            }
            result.candidate_errors.emplace_back(candidate->name(), score.error);
            PLOGD << fmt::format("Item '{}': {} {}={:.4f}", item_id, candidate->name(), score.metric, score.error);
            if (score.error < best_error - 1e-9) {
                best_error = score.error;
                best_score = std::move(score);
                best = candidate.get();
            }
        } catch (const ComputationError& e) {
            PLOG_WARNING << fmt::format("Item '{}': candidate {} skipped: {}", item_id, candidate->name(), e.what());
            result.rationale_tags.push_back(fmt::format("skipped:{}:{}", candidate->name(), e.what()));
        }
    }

    if (best == nullptr) {
        PLOG_WARNING << fmt::format("Item '{}': every candidate failed, using the series mean", item_id);
        fallback_to_mean(result, values, horizon, config);
        return result;
    }

    try {
        best->fit(series);
    } catch (const ComputationError& e) {
        PLOG_WARNING << fmt::format("Item '{}': refit of {} failed: {}", item_id, best->name(), e.what());
        result.rationale_tags.push_back(fmt::format("skipped:{}:{}", best->name(), e.what()));
        fallback_to_mean(result, values, horizon, config);
        return result;
    }

    result.model_name = best->name();
    result.error_metric = best_score.error;
    result.error_metric_name = best_score.metric;
    result.rationale_tags.push_back(fmt::format("selected:{}", best->name()));
    for (auto& note : best->notes()) result.rationale_tags.push_back(note);
    finish(result, best->predict(horizon), root_mean_square(best_score.residuals), config.interval_z);

    PLOGI << fmt::format("Item '{}': selected {} ({}={:.4f}), {:.3f}/period", item_id, result.model_name,
                         result.error_metric_name, result.error_metric, result.predicted_quantity_per_period);
    return result;
}

}
