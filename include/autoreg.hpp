#ifndef TSM_AUTOREG_HPP
#define TSM_AUTOREG_HPP

#include "integrity_model.hpp"
#include "memo_cache.hpp"
#include "model.hpp"
#include "serialization.hpp"
#include "tensor.hpp"
#include "time_frame.hpp"
#include "utils.hpp"
#include <string>
#include <vector>

namespace tsm {

/**
 * Vector autoregression without intercept or trend
 *
 * y_t = A_1 * y_{t-1} + ... + A_p * y_{t-p} + e_t
 *
 * Coefficients are estimated jointly for all series by least squares on the
 * stacked lag matrix. With fewer observations than regressors the
 * minimum-norm solution is used.
 */
class VectorAutoregression {
public:
    VectorAutoregression() = default;

    /**
     * Fit the model
     * @param series Observations (rows = time, cols = series)
     * @param lags Order p, positive
     * @throws InsufficientDataError with fewer than `lags` rows
     */
    void fit(const matrix::Matrix& series, int lags);

    /**
     * Iterated forecast continuing the last `lags` rows of `context`
     * @return steps x num_series() forecasts
     */
    matrix::Matrix forecast(const matrix::Matrix& context, int steps) const;

    int lags() const { return lags_; }
    size_t num_series() const { return k_; }
    bool is_fitted() const { return fitted_; }

    // (k * p) x k, row (l - 1) * k + j holds the weights of y_{t-l}[j]
    const matrix::Matrix& coefficients() const { return coef_; }

    void save(BinaryWriter& w) const;
    void load(BinaryReader& r);

private:
    int lags_ = 0;
    size_t k_ = 0;
    matrix::Matrix coef_;
    bool fitted_ = false;
};

/**
 * Forecasting strategy on differenced series.
 *
 * train() fits a lag-max_lag VAR on the first differences. predict()
 * forecasts the next differences, scales them by kDriftFactor, accumulates
 * them starting from the last observed difference and rounds to integers.
 */
class AutoRegressive {
public:
    static constexpr const char* kind = "AutoRegModel";

    // Heuristic upward bias applied to every forecast difference. Fixed, not fitted.
    static constexpr double kDriftFactor = 1.005;

    struct TrainOptions {
        int max_lag = 300;
    };

    struct PredictOptions {
        int steps = 200;

        void sign(CallSignature& signature) const { signature.keyword("steps", steps); }
    };

    /**
     * @throws InvalidArgumentError if max_lag is not positive
     * @throws InsufficientDataError with fewer than max_lag differenced rows
     */
    void train(const Tensor& data, const TrainOptions& options);

    /**
     * @return Tensor of shape (steps, <trailing dimensions of data>)
     * @throws InvalidArgumentError on negative steps
     * @throws InsufficientDataError with fewer than max_lag differenced rows
     */
    Tensor predict(const Tensor& data, const PredictOptions& options) const;

    int max_lag() const { return var_.lags(); }
    const VectorAutoregression& var() const { return var_; }

    void save(BinaryWriter& w) const;
    void load(BinaryReader& r);

private:
    VectorAutoregression var_;
};

/**
 * Autoregressive forecaster with duration-based queries on time-indexed data.
 *
 * Usage:
 *   AutoRegModel model({{7}, {7}});
 *   model.train(frame.slice(0, 1000).values(), {300});
 *   TimeFrame future = model.predict_duration(frame.slice(0, 1000), std::chrono::hours(2));
 */
class AutoRegModel : public Model<AutoRegressive> {
public:
    explicit AutoRegModel(ModelOptions options);

    /**
     * Forecast at least `duration` past the last timestamp of `frame`.
     * steps = ceil(duration / median gap) + 1; the result is indexed by the
     * last timestamp plus multiples of the median gap.
     * @throws InvalidArgumentError if the gap cannot be estimated
     */
    TimeFrame predict_duration(const TimeFrame& frame, Duration duration);

    // Same forecast as a plain (steps, columns) tensor
    Tensor predict_duration_values(const TimeFrame& frame, Duration duration);

    /**
     * Steps needed to cover `duration` at the frame's sampling interval
     * @throws InvalidArgumentError if the count does not fit an int
     */
    static int steps_for(const TimeFrame& frame, Duration duration);

    static AutoRegModel load(const std::filesystem::path& path);

private:
    AutoRegModel() = default;
};

/**
 * The same recurrence over TimeFrame objects. The forecast keeps the input's
 * column names and continues its index at the median sampling interval.
 */
class AutoRegFrames {
public:
    using Input = TimeFrame;
    using Output = TimeFrame;

    static constexpr const char* kind = "AutoRegFrameModel";

    using TrainOptions = AutoRegressive::TrainOptions;
    using PredictOptions = AutoRegressive::PredictOptions;

    void train(const TimeFrame& data, const TrainOptions& options);

    /**
     * @throws ShapeError if the columns differ from the training columns
     */
    TimeFrame predict(const TimeFrame& data, const PredictOptions& options) const;

    const std::vector<std::string>& columns() const { return columns_; }
    int max_lag() const { return var_.lags(); }

    void save(BinaryWriter& w) const;
    void load(BinaryReader& r);

private:
    std::vector<std::string> columns_;
    VectorAutoregression var_;
};

using AutoRegFrameModel = IntegrityModel<AutoRegFrames>;

} // namespace tsm

#endif // TSM_AUTOREG_HPP
