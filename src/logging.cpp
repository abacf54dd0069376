#include "logging.hpp"
#include "errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace tsm {
namespace logging {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("tsmodel");
        if (existing) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt("tsmodel");
        created->set_level(spdlog::level::warn);
        created->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
        return created;
    }();
    return instance;
}

void set_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        throw InvalidArgumentError("Unknown log level: " + level);
    }
    logger()->set_level(parsed);
}

} // namespace logging
} // namespace tsm
