#include "forecast_models.hpp"

#include "errors.hpp"
#include "periods.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numeric>
#include <random>

namespace pharmiq {
namespace {

double clip(double value) {
    return std::isfinite(value) ? std::max(0.0, value) : 0.0;
}

struct TreeBuilder {
    const Eigen::MatrixXd& x;
    const Eigen::VectorXd& y;
    std::size_t max_depth;
    std::size_t min_leaf;

    template <typename Node>
    int build(std::vector<Node>& tree, std::vector<Eigen::Index> rows, std::size_t depth) const {
        double sum = 0.0;
        double sum_sq = 0.0;
        for (const auto r : rows) {
            sum += y(r);
            sum_sq += y(r) * y(r);
        }
        const double count = static_cast<double>(rows.size());
        const double sse = sum_sq - sum * sum / count;

        const int index = static_cast<int>(tree.size());
        tree.push_back(Node{});
        tree[index].value = sum / count;

        if (depth >= max_depth || rows.size() < 2 * min_leaf || sse <= 1e-12) return index;

        int best_feature = -1;
        double best_threshold = 0.0;
        double best_sse = sse - 1e-12;

        for (Eigen::Index f = 0; f < x.cols(); ++f) {
            std::sort(rows.begin(), rows.end(), [&](Eigen::Index a, Eigen::Index b) { return x(a, f) < x(b, f); });

            double left_sum = 0.0;
            double left_sq = 0.0;
            for (std::size_t k = 1; k < rows.size(); ++k) {
                const double v = y(rows[k - 1]);
                left_sum += v;
                left_sq += v * v;
                if (k < min_leaf || rows.size() - k < min_leaf) continue;
                if (x(rows[k - 1], f) == x(rows[k], f)) continue;

                const double left_n = static_cast<double>(k);
                const double right_n = count - left_n;
                const double right_sum = sum - left_sum;
                const double right_sq = sum_sq - left_sq;
                const double split_sse =
                    (left_sq - left_sum * left_sum / left_n) + (right_sq - right_sum * right_sum / right_n);
                if (split_sse < best_sse) {
                    best_sse = split_sse;
                    best_feature = static_cast<int>(f);
                    best_threshold = 0.5 * (x(rows[k - 1], f) + x(rows[k], f));
                }
            }
        }

        if (best_feature < 0) return index;

        std::vector<Eigen::Index> left_rows;
        std::vector<Eigen::Index> right_rows;
        for (const auto r : rows) {
            (x(r, best_feature) <= best_threshold ? left_rows : right_rows).push_back(r);
        }

        tree[index].feature = best_feature;
        tree[index].threshold = best_threshold;
        const int left = build(tree, std::move(left_rows), depth + 1);
        const int right = build(tree, std::move(right_rows), depth + 1);
        tree[index].left = left;
        tree[index].right = right;
        return index;
    }
};

}

ValidationScore score_predictions(const std::vector<double>& predicted, const std::vector<double>& actual) {
    ValidationScore score;
    const std::size_t n = std::min(predicted.size(), actual.size());
    if (n == 0) {
        score.metric = "none";
        return score;
    }

    const bool any_zero = std::any_of(actual.begin(), actual.begin() + static_cast<std::ptrdiff_t>(n),
                                      [](double v) { return v == 0.0; });
    score.metric = any_zero ? "mae" : "mape";
    score.residuals.reserve(n);

    double total = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double residual = actual[i] - predicted[i];
        score.residuals.push_back(residual);
        total += any_zero ? std::fabs(residual) : std::fabs(residual / actual[i]) * 100.0;
    }
    score.error = total / static_cast<double>(n);
    return score;
}

ValidationScore ForecastModel::validation_error(const TimeSeries& holdout) const {
    return score_predictions(predict(holdout.size()), holdout.values());
}

void LinearTrendModel::fit(const TimeSeries& series) {
    const auto n = static_cast<Eigen::Index>(series.size());
    if (n < 2) {
        throw ComputationError("linear trend needs at least 2 periods");
    }

    Eigen::MatrixXd design(n, 2);
    Eigen::VectorXd target(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        design(i, 0) = 1.0;
        design(i, 1) = static_cast<double>(i);
        target(i) = series.points[static_cast<std::size_t>(i)].quantity;
    }

    const Eigen::VectorXd coef = design.colPivHouseholderQr().solve(target);
    if (!coef.allFinite()) {
        throw ComputationError("linear trend least squares did not converge");
    }

    intercept_ = coef(0);
    slope_ = coef(1);
    fitted_length_ = static_cast<std::size_t>(n);
}

std::vector<double> LinearTrendModel::predict(std::size_t horizon) const {
    std::vector<double> out;
    out.reserve(horizon);
    for (std::size_t h = 0; h < horizon; ++h) {
        out.push_back(clip(intercept_ + slope_ * static_cast<double>(fitted_length_ + h)));
    }
    return out;
}

EnsembleModel::EnsembleModel(std::size_t lags, std::size_t trees, std::size_t max_depth, std::size_t min_leaf,
                             std::uint32_t seed)
    : lags_(lags), tree_count_(trees), max_depth_(max_depth), min_leaf_(min_leaf), seed_(seed) {}

std::vector<double> EnsembleModel::features_at(const std::vector<double>& history, std::size_t end,
                                               std::int64_t period) const {
    std::vector<double> row;
    row.reserve(lags_ + 2);
    double sum = 0.0;
    for (std::size_t lag = 1; lag <= lags_; ++lag) {
        const double v = history[end - lag];
        row.push_back(v);
        sum += v;
    }
    row.push_back(sum / static_cast<double>(lags_));
    row.push_back(static_cast<double>(season_position(period, granularity_)));
    return row;
}

void EnsembleModel::fit(const TimeSeries& series) {
    history_ = series.values();
    granularity_ = series.granularity;
    trees_.clear();

    if (history_.size() < 2 * lags_ + 2) {
        throw ComputationError(
            fmt::format("ensemble needs at least {} periods, got {}", 2 * lags_ + 2, history_.size()));
    }

    const auto rows = static_cast<Eigen::Index>(history_.size() - lags_);
    const auto cols = static_cast<Eigen::Index>(lags_ + 2);
    Eigen::MatrixXd x(rows, cols);
    Eigen::VectorXd y(rows);
    for (Eigen::Index r = 0; r < rows; ++r) {
        const std::size_t i = static_cast<std::size_t>(r) + lags_;
        const auto row = features_at(history_, i, series.points[i].period);
        for (Eigen::Index c = 0; c < cols; ++c) x(r, c) = row[static_cast<std::size_t>(c)];
        y(r) = history_[i];
    }
    last_period_ = series.points.back().period;

    std::mt19937 rng(seed_);
    std::uniform_int_distribution<Eigen::Index> pick(0, rows - 1);
    const TreeBuilder builder{x, y, max_depth_, min_leaf_};

    trees_.reserve(tree_count_);
    for (std::size_t t = 0; t < tree_count_; ++t) {
        std::vector<Eigen::Index> sample(static_cast<std::size_t>(rows));
        for (auto& r : sample) r = pick(rng);
        Tree tree;
        builder.build(tree, std::move(sample), 0);
        trees_.push_back(std::move(tree));
    }
}

double EnsembleModel::predict_row(const std::vector<double>& row) const {
    double total = 0.0;
    for (const auto& tree : trees_) {
        int node = 0;
        while (tree[static_cast<std::size_t>(node)].feature >= 0) {
            const auto& n = tree[static_cast<std::size_t>(node)];
            node = row[static_cast<std::size_t>(n.feature)] <= n.threshold ? n.left : n.right;
        }
        total += tree[static_cast<std::size_t>(node)].value;
    }
    return total / static_cast<double>(trees_.size());
}

std::vector<double> EnsembleModel::predict(std::size_t horizon) const {
    std::vector<double> out;
    if (trees_.empty()) return out;

    std::vector<double> history = history_;
    out.reserve(horizon);
    for (std::size_t h = 1; h <= horizon; ++h) {
        const std::int64_t period = last_period_ + static_cast<std::int64_t>(h);
        const double value = clip(predict_row(features_at(history, history.size(), period)));
        out.push_back(value);
        history.push_back(value);
    }
    return out;
}

void SeasonalModel::fit(const TimeSeries& series) {
    if (series.empty()) {
        throw ComputationError("seasonal model needs at least 1 period");
    }

    const auto values = series.values();
    const std::size_t season = season_length(series.granularity);
    last_season_.clear();

    if (values.size() > season) {
        last_season_.assign(values.end() - static_cast<std::ptrdiff_t>(season), values.end());
        return;
    }

    level_ = values.front();
    for (std::size_t i = 1; i < values.size(); ++i) {
        level_ = alpha_ * values[i] + (1.0 - alpha_) * level_;
    }
}

std::vector<double> SeasonalModel::predict(std::size_t horizon) const {
    std::vector<double> out;
    out.reserve(horizon);
    for (std::size_t h = 0; h < horizon; ++h) {
        out.push_back(clip(last_season_.empty() ? level_ : last_season_[h % last_season_.size()]));
    }
    return out;
}

std::vector<std::string> SeasonalModel::notes() const {
    return {is_seasonal_naive() ? "seasonal:naive" : "seasonal:exponential_smoothing"};
}

std::vector<std::unique_ptr<ForecastModel>> make_candidates(const EngineConfig& config) {
    std::vector<std::unique_ptr<ForecastModel>> candidates;
    candidates.push_back(std::make_unique<LinearTrendModel>());
    candidates.push_back(std::make_unique<EnsembleModel>(config.ensemble_lags, config.ensemble_trees,
                                                         config.ensemble_max_depth, config.ensemble_min_leaf,
                                                         config.random_seed));
    candidates.push_back(std::make_unique<SeasonalModel>(config.smoothing_alpha));
    return candidates;
}

}
