#ifndef TSM_LOGGING_HPP
#define TSM_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace tsm {
namespace logging {

/**
 * Shared "tsmodel" logger (stderr, created on first use).
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * Set the level from its name: trace, debug, info, warn, error, critical, off.
 * Unknown names throw InvalidArgumentError.
 */
void set_level(const std::string& level);

} // namespace logging
} // namespace tsm

#ifndef TSM_NO_LOGGING
#define TSM_TRACE(...) ::tsm::logging::logger()->trace(__VA_ARGS__)
#define TSM_DEBUG(...) ::tsm::logging::logger()->debug(__VA_ARGS__)
#define TSM_INFO(...) ::tsm::logging::logger()->info(__VA_ARGS__)
#define TSM_WARN(...) ::tsm::logging::logger()->warn(__VA_ARGS__)
#define TSM_ERROR(...) ::tsm::logging::logger()->error(__VA_ARGS__)
#else
#define TSM_TRACE(...) (void)0
#define TSM_DEBUG(...) (void)0
#define TSM_INFO(...) (void)0
#define TSM_WARN(...) (void)0
#define TSM_ERROR(...) (void)0
#endif

#endif // TSM_LOGGING_HPP
