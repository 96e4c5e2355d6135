/**
 * @file config.hpp
 * @brief Filter tuning knobs and their JSON loader.
 *
 * @details
 * Every field has a working default, so `FilterConfig{}` is a valid
 * configuration. A JSON document only needs the keys it wants to change:
 * @code
 *   { "retry_interval_ms": 250, "max_retries": 8, "min_client_version": "0.3.1" }
 * @endcode
 * Unknown keys are ignored. A key with the wrong JSON type, a malformed
 * version string or an unreadable file makes the loader return
 * `std::nullopt` and log why.
 */
#ifndef NETWAY_CONFIG_HPP
#define NETWAY_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace netway {

struct FilterConfig {
  uint32_t retry_interval_ms{1000};         ///< age at which an unacked packet is resent
  uint32_t max_retries{5};                  ///< resends before the endpoint fails
  uint32_t tick_interval_ms{20};            ///< longest idle wait inside run()
  uint32_t keepalive_interval_ms{1000};     ///< client: send KeepAlive after this much silence
  uint32_t endpoint_idle_timeout_ms{30000}; ///< 0 disables
  uint32_t shutdown_drain_timeout_ms{5000}; ///< graceful shutdown gives up after this
  std::string server_version{"0.3.2"};      ///< sent in LoggedIn / IncompatibleVersion
  std::string min_client_version{"0.3.0"};  ///< oldest client accepted at Connect
};

/// Overlay the keys present in `j` on the defaults.
std::optional<FilterConfig> config_from_json(const nlohmann::json& j);

/// Read and parse a JSON file, then config_from_json().
std::optional<FilterConfig> load_config(const std::string& path);

/// Every field, for logging the effective configuration.
nlohmann::json config_to_json(const FilterConfig& cfg);

} // namespace netway

#endif // NETWAY_CONFIG_HPP
