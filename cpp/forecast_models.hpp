#pragma once

#include "config.hpp"
#include "types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pharmiq {

struct ValidationScore {
    double error = 0.0;
    std::string metric;  // "mape" (percent) or "mae"
    std::vector<double> residuals;
};

// MAPE over the holdout, or MAE when any actual is zero.
ValidationScore score_predictions(const std::vector<double>& predicted, const std::vector<double>& actual);

class ForecastModel {
public:
    virtual ~ForecastModel() = default;

    virtual std::string name() const = 0;
    // Throws ComputationError when the series cannot support this model.
    virtual void fit(const TimeSeries& series) = 0;
    // Predictions for the `horizon` periods following the fitted series, clipped at zero.
    virtual std::vector<double> predict(std::size_t horizon) const = 0;
    virtual std::vector<std::string> notes() const { return {}; }

    ValidationScore validation_error(const TimeSeries& holdout) const;
};

class LinearTrendModel : public ForecastModel {
public:
    std::string name() const override { return "linear"; }
    void fit(const TimeSeries& series) override;
    std::vector<double> predict(std::size_t horizon) const override;

    double intercept() const { return intercept_; }
    double slope() const { return slope_; }

private:
    double intercept_ = 0.0;
    double slope_ = 0.0;
    std::size_t fitted_length_ = 0;
};

class EnsembleModel : public ForecastModel {
public:
    EnsembleModel(std::size_t lags, std::size_t trees, std::size_t max_depth, std::size_t min_leaf,
                  std::uint32_t seed);

    std::string name() const override { return "ensemble"; }
    void fit(const TimeSeries& series) override;
    std::vector<double> predict(std::size_t horizon) const override;

private:
    struct Node {
        int feature = -1;
        double threshold = 0.0;
        double value = 0.0;
        int left = -1;
        int right = -1;
    };
    using Tree = std::vector<Node>;

    // Features for the period following history[0, end).
    std::vector<double> features_at(const std::vector<double>& history, std::size_t end, std::int64_t period) const;
    double predict_row(const std::vector<double>& row) const;

    std::size_t lags_;
    std::size_t tree_count_;
    std::size_t max_depth_;
    std::size_t min_leaf_;
    std::uint32_t seed_;

    Granularity granularity_ = Granularity::DAY;
    std::vector<double> history_;
    std::int64_t last_period_ = 0;
    std::vector<Tree> trees_;
};

class SeasonalModel : public ForecastModel {
public:
    explicit SeasonalModel(double alpha) : alpha_(alpha) {}

    std::string name() const override { return "seasonal"; }
    void fit(const TimeSeries& series) override;
    std::vector<double> predict(std::size_t horizon) const override;
    std::vector<std::string> notes() const override;

    bool is_seasonal_naive() const { return !last_season_.empty(); }

private:
    double alpha_;
    double level_ = 0.0;
    std::vector<double> last_season_;
};

// Candidates in tie-break priority order: linear, ensemble, seasonal.
std::vector<std::unique_ptr<ForecastModel>> make_candidates(const EngineConfig& config);

}
