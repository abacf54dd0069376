#ifndef TSM_INTEGRITY_MODEL_HPP
#define TSM_INTEGRITY_MODEL_HPP

#include "contract.hpp"
#include "model.hpp"
#include <filesystem>
#include <string>
#include <utility>

namespace tsm {

/**
 * Memoizing model over structured data objects.
 *
 * Same lifecycle and cache discipline as Model, with integrity checks in
 * place of shape checks. Strategy::Input and Strategy::Output are DataModel
 * types with an encode_argument overload and a CacheCodec specialisation.
 */
template <typename Strategy>
class IntegrityModel {
public:
    using Input = typename Strategy::Input;
    using Output = typename Strategy::Output;
    using TrainOptions = typename Strategy::TrainOptions;
    using PredictOptions = typename Strategy::PredictOptions;

    explicit IntegrityModel(std::filesystem::path cache_root = "model_cache")
        : cache_root_(std::move(cache_root)) {}

    /**
     * @throws IntegrityError if the data fails its own check
     */
    void train(const Input& data, const TrainOptions& options = TrainOptions()) {
        require_integrity(data, "training input");

        Strategy fitted = strategy_;
        fitted.train(data, options);

        strategy_ = std::move(fitted);
        auto location = binding_.start_session(cache_root_, Strategy::kind, state_fingerprint(strategy_));
        trained_ = true;
        TSM_INFO("Trained {} on {} rows, cache at {}", Strategy::kind, data.size(), location.string());
    }

    /**
     * @param check_output Re-check the produced object. Results that fail are
     *        never stored.
     * @throws ModelNotTrainedError before train()
     * @throws IntegrityError on a failing input or output
     */
    Output predict(const Input& data, const PredictOptions& options = PredictOptions(),
                   bool check_output = true) {
        if (!trained_) {
            throw ModelNotTrainedError(std::string(Strategy::kind) + " must be trained before predicting");
        }
        require_integrity(data, "prediction input");

        CallSignature signature;
        signature.function(std::string(Strategy::kind) + ".predict")
                 .receiver(binding_.identity())
                 .positional(data);
        options.sign(signature);

        bool checked = false;
        Output result = binding_.cache().get_or_compute<Output>(signature, [&]() {
            Output output = strategy_.predict(data, options);
            if (check_output) {
                require_integrity(output, "prediction output");
                checked = true;
            }
            return output;
        });
        if (check_output && !checked) {
            require_integrity(result, "prediction output");
        }
        return result;
    }

    void clear_cache(bool soft = false) { binding_.cache().clear(soft); }

    void dump(const std::filesystem::path& path) const {
        check_writable_destination(path);
        std::string fingerprint = state_fingerprint(strategy_);

        write_file(path, [&](BinaryWriter& w) {
            write_model_header(w, Strategy::kind);
            w.write(static_cast<uint8_t>(trained_ ? 1 : 0));
            w.write_string(cache_root_.string());
            binding_.save(w, Strategy::kind, fingerprint);
            strategy_.save(w);
        });
        TSM_INFO("Dumped {} to {}", Strategy::kind, path.string());
    }

    static IntegrityModel load(const std::filesystem::path& path) {
        check_readable_source(path);

        IntegrityModel model;
        read_file(path, [&](BinaryReader& r) {
            read_model_header(r, Strategy::kind);
            model.trained_ = r.read<uint8_t>() != 0;
            model.cache_root_ = r.read_string();
            model.binding_.load(r);
            model.strategy_.load(r);
        });
        TSM_INFO("Loaded {} from {}", Strategy::kind, path.string());
        return model;
    }

    bool trained() const { return trained_; }
    const Strategy& strategy() const { return strategy_; }
    const MemoCache& cache() const { return binding_.cache(); }
    const std::string& cache_identity() const { return binding_.identity(); }

private:
    std::filesystem::path cache_root_;
    Strategy strategy_;
    CacheBinding binding_;
    bool trained_ = false;

    template <typename T>
    static void require_integrity(const T& object, const std::string& what) {
        if (!object.check_integrity()) {
            throw IntegrityError(std::string(T::type_name) + " failed integrity check as " + what);
        }
    }
};

} // namespace tsm

#endif // TSM_INTEGRITY_MODEL_HPP
