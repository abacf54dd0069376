#ifndef TSM_CONFIG_HPP
#define TSM_CONFIG_HPP

#include "contract.hpp"
#include "model.hpp"
#include <filesystem>
#include <string>

namespace tsm {

/**
 * Model and run settings read from a JSON object:
 *
 *   {
 *     "input_shape":  [7],
 *     "output_shape": [7],
 *     "cache_root":   "model_cache",
 *     "max_lag":      300,
 *     "steps":        200,
 *     "log_level":    "info"
 *   }
 *
 * Both shapes are required. Any other key is rejected.
 */
struct ModelConfig {
    Shape input_shape;
    Shape output_shape;
    std::filesystem::path cache_root = "model_cache";
    int max_lag = 300;
    int steps = 200;
    std::string log_level = "warn";

    /**
     * @throws InvalidArgumentError on unknown keys, missing shapes or
     *         out of range values
     */
    static ModelConfig from_record(const Record& record);

    /**
     * @throws PathAccessError if the file cannot be read
     */
    static ModelConfig from_file(const std::filesystem::path& path);

    ModelOptions model_options() const;

    // Apply log_level to the library logger
    void apply_logging() const;
};

} // namespace tsm

#endif // TSM_CONFIG_HPP
