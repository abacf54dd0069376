#include "autoreg.hpp"
#include <cmath>
#include <limits>

namespace tsm {

namespace {

/**
 * Shared recurrence: difference, forecast, drift, accumulate, round.
 * @param rows Levels (rows = time)
 * @return steps x width rounded levels
 */
matrix::Matrix forecast_levels(const VectorAutoregression& var, const matrix::Matrix& rows, int steps) {
    if (steps < 0) {
        throw InvalidArgumentError("steps must be non-negative, got " + std::to_string(steps));
    }

    matrix::Matrix diffs = stats::difference(rows);
    if (diffs.size() < static_cast<size_t>(var.lags())) {
        throw InsufficientDataError("Need at least " + std::to_string(var.lags()) +
                                    " differenced rows to forecast, got " + std::to_string(diffs.size()));
    }
    if (diffs.empty() || diffs[0].size() != var.num_series()) {
        throw InvalidArgumentError("Series width does not match the fitted model");
    }

    matrix::Matrix forecast = var.forecast(diffs, steps);

    // Running sum seeded by the last observed difference
    std::vector<double> level = diffs.back();
    matrix::Matrix result(forecast.size());
    for (size_t s = 0; s < forecast.size(); ++s) {
        result[s].resize(level.size());
        for (size_t j = 0; j < level.size(); ++j) {
            level[j] += forecast[s][j] * AutoRegressive::kDriftFactor;
            result[s][j] = std::nearbyint(level[j]);
        }
    }
    return result;
}

matrix::Matrix fit_input(const matrix::Matrix& rows, int max_lag) {
    if (max_lag <= 0) {
        throw InvalidArgumentError("max_lag must be positive, got " + std::to_string(max_lag));
    }
    matrix::Matrix diffs = stats::difference(rows);
    if (diffs.size() < static_cast<size_t>(max_lag)) {
        throw InsufficientDataError("Need at least " + std::to_string(max_lag) +
                                    " differenced rows to train, got " + std::to_string(diffs.size()));
    }
    return diffs;
}

} // namespace

// ============================================================
// VectorAutoregression
// ============================================================

void VectorAutoregression::fit(const matrix::Matrix& series, int lags) {
    if (lags <= 0) {
        throw InvalidArgumentError("VAR order must be positive");
    }
    size_t p = static_cast<size_t>(lags);
    size_t n = series.size();
    if (n < p) {
        throw InsufficientDataError("VAR(" + std::to_string(lags) + ") needs at least " +
                                    std::to_string(lags) + " observations, got " + std::to_string(n));
    }

    size_t k = series[0].size();
    size_t obs = n - p;

    if (obs == 0) {
        coef_ = matrix::zeros(k * p, k);
    } else {
        // Z[t] = [y_{t-1}, ..., y_{t-p}], Y[t] = y_t
        matrix::Matrix Z(obs, std::vector<double>(k * p));
        matrix::Matrix Y(obs);
        for (size_t t = p; t < n; ++t) {
            size_t row = t - p;
            for (size_t l = 1; l <= p; ++l) {
                const auto& lagged = series[t - l];
                std::copy(lagged.begin(), lagged.end(), Z[row].begin() + (l - 1) * k);
            }
            Y[row] = series[t];
        }
        coef_ = matrix::least_squares(Z, Y);
    }

    lags_ = lags;
    k_ = k;
    fitted_ = true;
    TSM_DEBUG("Fitted VAR({}) on {} observations of {} series", lags, obs, k);
}

matrix::Matrix VectorAutoregression::forecast(const matrix::Matrix& context, int steps) const {
    if (!fitted_) {
        throw std::runtime_error("Model must be fitted before forecasting");
    }
    size_t p = static_cast<size_t>(lags_);
    if (context.size() < p) {
        throw InsufficientDataError("Forecast needs " + std::to_string(p) + " rows of context");
    }

    matrix::Matrix history(context.end() - p, context.end());
    matrix::Matrix result;
    result.reserve(steps > 0 ? static_cast<size_t>(steps) : 0);

    for (int s = 0; s < steps; ++s) {
        std::vector<double> next(k_, 0.0);
        size_t n = history.size();
        for (size_t l = 1; l <= p; ++l) {
            const auto& lagged = history[n - l];
            for (size_t j = 0; j < k_; ++j) {
                const auto& weights = coef_[(l - 1) * k_ + j];
                double x = lagged[j];
                for (size_t i = 0; i < k_; ++i) {
                    next[i] += x * weights[i];
                }
            }
        }
        history.push_back(next);
        result.push_back(std::move(next));
    }
    return result;
}

void VectorAutoregression::save(BinaryWriter& w) const {
    w.write(static_cast<uint8_t>(fitted_ ? 1 : 0));
    w.write(static_cast<int32_t>(lags_));
    w.write_size(k_);
    w.write_size(coef_.size());
    for (const auto& row : coef_) {
        w.write_doubles(row);
    }
}

void VectorAutoregression::load(BinaryReader& r) {
    fitted_ = r.read<uint8_t>() != 0;
    lags_ = r.read<int32_t>();
    k_ = r.read_size();

    coef_.assign(r.read_size(), {});
    for (auto& row : coef_) {
        row = r.read_doubles();
        if (row.size() != k_) {
            throw std::runtime_error("Corrupt VAR coefficients");
        }
    }
    if (fitted_ && (lags_ <= 0 || coef_.size() != k_ * static_cast<size_t>(lags_))) {
        throw std::runtime_error("Corrupt VAR coefficients");
    }
}

// ============================================================
// AutoRegressive
// ============================================================

void AutoRegressive::train(const Tensor& data, const TrainOptions& options) {
    matrix::Matrix diffs = fit_input(data.to_rows(), options.max_lag);
    var_.fit(diffs, options.max_lag);
}

Tensor AutoRegressive::predict(const Tensor& data, const PredictOptions& options) const {
    matrix::Matrix levels = forecast_levels(var_, data.to_rows(), options.steps);

    Shape shape = data.shape();
    shape[0] = levels.size();

    std::vector<double> values;
    values.reserve(levels.size() * data.row_width());
    for (const auto& row : levels) {
        values.insert(values.end(), row.begin(), row.end());
    }
    return Tensor(shape, std::move(values));
}

void AutoRegressive::save(BinaryWriter& w) const {
    var_.save(w);
}

void AutoRegressive::load(BinaryReader& r) {
    var_.load(r);
}

// ============================================================
// AutoRegModel
// ============================================================

AutoRegModel::AutoRegModel(ModelOptions options) : Model<AutoRegressive>(std::move(options)) {}

int AutoRegModel::steps_for(const TimeFrame& frame, Duration duration) {
    Duration gap = frame.median_gap();
    double steps = std::ceil(static_cast<double>(duration.count()) / static_cast<double>(gap.count()));
    if (steps > static_cast<double>(std::numeric_limits<int>::max() - 1)) {
        throw InvalidArgumentError("duration too long for the sampling interval");
    }
    return static_cast<int>(steps) + 1;
}

TimeFrame AutoRegModel::predict_duration(const TimeFrame& frame, Duration duration) {
    Tensor values = predict_duration_values(frame, duration);
    auto index = frame.future_index(values.rows(), frame.median_gap());
    return TimeFrame(std::move(index), frame.columns(), values.to_rows());
}

Tensor AutoRegModel::predict_duration_values(const TimeFrame& frame, Duration duration) {
    int steps = steps_for(frame, duration);
    TSM_DEBUG("Duration query resolved to {} steps", steps);
    return predict(frame.values(), PredictOptions{steps});
}

AutoRegModel AutoRegModel::load(const std::filesystem::path& path) {
    AutoRegModel model;
    model.read_from(path);
    return model;
}

// ============================================================
// AutoRegFrames
// ============================================================

void AutoRegFrames::train(const TimeFrame& data, const TrainOptions& options) {
    matrix::Matrix diffs = fit_input(data.rows(), options.max_lag);
    var_.fit(diffs, options.max_lag);
    columns_ = data.columns();
}

TimeFrame AutoRegFrames::predict(const TimeFrame& data, const PredictOptions& options) const {
    if (data.columns() != columns_) {
        throw ShapeError("Frame columns do not match the " + std::to_string(columns_.size()) +
                         " training columns");
    }
    matrix::Matrix levels = forecast_levels(var_, data.rows(), options.steps);
    auto index = data.future_index(levels.size(), data.median_gap());
    return TimeFrame(std::move(index), columns_, std::move(levels));
}

void AutoRegFrames::save(BinaryWriter& w) const {
    w.write_size(columns_.size());
    for (const auto& name : columns_) {
        w.write_string(name);
    }
    var_.save(w);
}

void AutoRegFrames::load(BinaryReader& r) {
    columns_.assign(r.read_size(), std::string());
    for (auto& name : columns_) {
        name = r.read_string();
    }
    var_.load(r);
}

} // namespace tsm
