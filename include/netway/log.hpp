/**
 * @file log.hpp
 * @brief spdlog-backed logging for netway.
 *
 * @details
 * One named logger, `"netway"`, shared by every layer. Call `log::init()` once
 * from the owning process to choose the level; if nobody does, the first
 * `NW_*` macro creates the logger on a colored stdout sink at `warn`, so a
 * library user who never configures logging only sees problems.
 *
 * Use the macros, not the logger directly:
 * @code
 *   NW_DEBUG("endpoint {} acked up to {}", ep.to_string(), ack);
 * @endcode
 */
#ifndef NETWAY_LOG_HPP
#define NETWAY_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace netway {
namespace log {

/// Create (or reconfigure) the "netway" logger at `level`.
void init(spdlog::level::level_enum level = spdlog::level::info);

/// Parse "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off".
spdlog::level::level_enum level_from_string(const std::string& name);

/// The shared logger; created lazily at `warn` when init() was not called.
std::shared_ptr<spdlog::logger>& logger();

} // namespace log
} // namespace netway

#define NW_TRACE(...) ::netway::log::logger()->trace(__VA_ARGS__)
#define NW_DEBUG(...) ::netway::log::logger()->debug(__VA_ARGS__)
#define NW_INFO(...)  ::netway::log::logger()->info(__VA_ARGS__)
#define NW_WARN(...)  ::netway::log::logger()->warn(__VA_ARGS__)
#define NW_ERROR(...) ::netway::log::logger()->error(__VA_ARGS__)

#endif // NETWAY_LOG_HPP
