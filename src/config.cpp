#include "config.hpp"
#include "logging.hpp"
#include "serialization.hpp"

#include <boost/property_tree/json_parser.hpp>

namespace tsm {

namespace {

Shape read_shape(const Record& record, const std::string& key) {
    auto child = record.get_child_optional(key);
    if (!child) {
        throw InvalidArgumentError("Missing required field '" + key + "'");
    }

    Shape shape;
    for (const auto& item : *child) {
        auto extent = item.second.get_value_optional<long long>();
        if (!extent) {
            throw InvalidArgumentError("Field '" + key + "' must be an array of integers");
        }
        if (*extent <= 0) {
            throw InvalidArgumentError("Field '" + key + "' must only contain positive extents");
        }
        shape.push_back(static_cast<size_t>(*extent));
    }
    ShapeContract::check_declared(shape, key);
    return shape;
}

int read_at_least(const Record& record, const std::string& key, int fallback, int minimum) {
    auto child = record.get_child_optional(key);
    if (!child) {
        return fallback;
    }
    auto parsed = child->get_value_optional<int>();
    if (!parsed) {
        throw InvalidArgumentError("Field '" + key + "' must be an integer, got '" +
                                   child->get_value<std::string>() + "'");
    }
    int value = *parsed;
    if (value < minimum) {
        throw InvalidArgumentError("Field '" + key + "' must be at least " + std::to_string(minimum) +
                                   ", got " + std::to_string(value));
    }
    return value;
}

} // namespace

ModelConfig ModelConfig::from_record(const Record& record) {
    require_known_fields(record,
                         {"input_shape", "output_shape", "cache_root", "max_lag", "steps", "log_level"},
                         "model configuration");

    ModelConfig config;
    config.input_shape = read_shape(record, "input_shape");
    config.output_shape = read_shape(record, "output_shape");
    config.cache_root = record.get<std::string>("cache_root", config.cache_root.string());
    config.max_lag = read_at_least(record, "max_lag", config.max_lag, 1);
    config.steps = read_at_least(record, "steps", config.steps, 0);
    config.log_level = record.get<std::string>("log_level", config.log_level);

    if (config.cache_root.empty()) {
        throw InvalidArgumentError("Field 'cache_root' must not be empty");
    }
    return config;
}

ModelConfig ModelConfig::from_file(const std::filesystem::path& path) {
    check_readable_source(path);

    Record record;
    boost::property_tree::read_json(path.string(), record);
    return from_record(record);
}

ModelOptions ModelConfig::model_options() const {
    ModelOptions options;
    options.input_shape = input_shape;
    options.output_shape = output_shape;
    options.cache_root = cache_root;
    return options;
}

void ModelConfig::apply_logging() const {
    logging::set_level(log_level);
}

} // namespace tsm
