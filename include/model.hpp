#ifndef TSM_MODEL_HPP
#define TSM_MODEL_HPP

#include "contract.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "memo_cache.hpp"
#include "serialization.hpp"
#include "tensor.hpp"
#include "utils.hpp"
#include <filesystem>
#include <sstream>
#include <string>
#include <utility>

namespace tsm {

/**
 * Construction parameters shared by all shape-checked models.
 */
struct ModelOptions {
    Shape input_shape;
    Shape output_shape;

    // Parent of the per-training cache directories
    std::filesystem::path cache_root = "model_cache";
};

// Model file header: magic, format version, model kind
void write_model_header(BinaryWriter& w, const std::string& kind);

/**
 * @throws TypeMismatchError on a foreign file or a different model kind
 * @throws std::runtime_error on an unsupported format version
 */
void read_model_header(BinaryReader& r, const std::string& kind);

/**
 * Hash of a strategy's serialized state. Two strategies with the same
 * fitted parameters share a fingerprint.
 */
template <typename Strategy>
std::string state_fingerprint(const Strategy& strategy) {
    std::ostringstream oss;
    BinaryWriter w(oss);
    strategy.save(w);
    return hash::to_hex(hash::fnv1a(oss.str()));
}

/**
 * A model's memoization cache together with the receiver identity that
 * prefixes every key it produces.
 *
 * Starts transient with an empty identity. Every training session moves it
 * to a fresh persistent directory; the previous directory is left in place.
 */
class CacheBinding {
public:
    /**
     * Switch to <root>/<session token> and derive a new identity.
     * @return the new cache location
     */
    std::filesystem::path start_session(const std::filesystem::path& root,
                                        const std::string& kind,
                                        const std::string& fingerprint);

    /**
     * Cache record for a model file. The record carries the current location
     * and a fresh snapshot identity, so every instance loaded from the same
     * file shares entries with the others but not with the dumped instance.
     */
    void save(BinaryWriter& w, const std::string& kind, const std::string& fingerprint) const;
    void load(BinaryReader& r);

    MemoCache& cache() { return cache_; }
    const MemoCache& cache() const { return cache_; }
    const std::string& identity() const { return identity_; }

private:
    MemoCache cache_;
    std::string identity_;
};

/**
 * Shape-checked, memoizing model around a forecasting strategy.
 *
 * train() and predict() always run the shape checks; the strategy only sees
 * validated tensors. A Strategy provides:
 *   static constexpr const char* kind;
 *   struct TrainOptions   { ... };
 *   struct PredictOptions { void sign(CallSignature&) const; ... };
 *   void train(const Tensor&, const TrainOptions&);
 *   Tensor predict(const Tensor&, const PredictOptions&) const;
 *   void save(BinaryWriter&) const;
 *   void load(BinaryReader&);
 */
template <typename Strategy>
class Model {
public:
    using TrainOptions = typename Strategy::TrainOptions;
    using PredictOptions = typename Strategy::PredictOptions;

    /**
     * @throws InvalidArgumentError on an empty shape or a zero extent
     */
    explicit Model(ModelOptions options) : options_(std::move(options)) {
        ShapeContract::check_declared(options_.input_shape, "input_shape");
        ShapeContract::check_declared(options_.output_shape, "output_shape");
    }

    /**
     * Fit the strategy on a copy and commit it only on success: a failed
     * training leaves state, cache and trained flag untouched.
     * @throws ShapeError if the trailing dimensions differ from input_shape
     */
    void train(const Tensor& data, const TrainOptions& options = TrainOptions()) {
        ShapeContract::validate(data, options_.input_shape, "training input");

        Strategy fitted = strategy_;
        fitted.train(data, options);

        strategy_ = std::move(fitted);
        auto location = binding_.start_session(options_.cache_root, Strategy::kind,
                                               state_fingerprint(strategy_));
        trained_ = true;
        TSM_INFO("Trained {} on {} rows, cache at {}", Strategy::kind, data.rows(), location.string());
    }

    /**
     * Memoized prediction. Repeated calls with identical data and options are
     * answered from the cache.
     * @throws ModelNotTrainedError before train()
     * @throws ShapeError on a non-conforming input or output
     */
    Tensor predict(const Tensor& data, const PredictOptions& options = PredictOptions()) {
        if (!trained_) {
            throw ModelNotTrainedError(std::string(Strategy::kind) + " must be trained before predicting");
        }
        ShapeContract::validate(data, options_.input_shape, "prediction input");

        CallSignature signature;
        signature.function(std::string(Strategy::kind) + ".predict")
                 .receiver(binding_.identity())
                 .positional(data);
        options.sign(signature);

        Tensor result = binding_.cache().get_or_compute<Tensor>(signature, [&]() {
            Tensor output = strategy_.predict(data, options);
            ShapeContract::validate(output, options_.output_shape, "prediction output");
            return output;
        });
        ShapeContract::validate(result, options_.output_shape, "prediction output");
        return result;
    }

    // Drop the in-memory index; unless soft, delete the cache directory too
    void clear_cache(bool soft = false) { binding_.cache().clear(soft); }

    /**
     * Write the whole model (shapes, cache record, strategy state).
     * Compression follows the file suffix.
     * @throws PathAccessError if the parent directory is missing or read-only
     */
    void dump(const std::filesystem::path& path) const {
        check_writable_destination(path);
        std::string fingerprint = state_fingerprint(strategy_);

        write_file(path, [&](BinaryWriter& w) {
            write_model_header(w, Strategy::kind);
            w.write(static_cast<uint8_t>(trained_ ? 1 : 0));
            w.write_shape(options_.input_shape);
            w.write_shape(options_.output_shape);
            w.write_string(options_.cache_root.string());
            binding_.save(w, Strategy::kind, fingerprint);
            strategy_.save(w);
        });
        TSM_INFO("Dumped {} to {}", Strategy::kind, path.string());
    }

    /**
     * @throws PathAccessError if the file is missing or unreadable
     * @throws TypeMismatchError if the file holds another kind of model
     */
    static Model load(const std::filesystem::path& path) {
        Model model;
        model.read_from(path);
        return model;
    }

    bool trained() const { return trained_; }
    const Shape& input_shape() const { return options_.input_shape; }
    const Shape& output_shape() const { return options_.output_shape; }
    const ModelOptions& options() const { return options_; }
    const Strategy& strategy() const { return strategy_; }

    const MemoCache& cache() const { return binding_.cache(); }
    const std::string& cache_identity() const { return binding_.identity(); }

protected:
    // Empty shell for load()
    Model() = default;

    void read_from(const std::filesystem::path& path) {
        check_readable_source(path);

        read_file(path, [&](BinaryReader& r) {
            read_model_header(r, Strategy::kind);
            trained_ = r.read<uint8_t>() != 0;
            options_.input_shape = r.read_shape();
            options_.output_shape = r.read_shape();
            options_.cache_root = r.read_string();
            binding_.load(r);
            strategy_.load(r);
        });
        TSM_INFO("Loaded {} from {}", Strategy::kind, path.string());
    }

private:
    ModelOptions options_;
    Strategy strategy_;
    CacheBinding binding_;
    bool trained_ = false;
};

template <typename M>
void dump(const M& model, const std::filesystem::path& path) {
    model.dump(path);
}

template <typename M>
M load(const std::filesystem::path& path) {
    return M::load(path);
}

} // namespace tsm

#endif // TSM_MODEL_HPP
