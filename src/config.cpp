// -----------------------------------------------------------------------------
// config.cpp: FilterConfig JSON loading.
//
// POLICY:
//   - Missing keys keep their defaults.
//   - A present key must have the right type; otherwise the whole load fails.
//   - Version strings must parse; the server must be able to check clients.
// -----------------------------------------------------------------------------
#include "netway/config.hpp"

#include <fstream>

#include "netway/log.hpp"
#include "netway/version.hpp"

using nlohmann::json;

namespace netway {

namespace {

template <typename T>
void read_if_present(const json& j, const char* key, T& field) {
  auto it = j.find(key);
  if (it != j.end()) field = it->get<T>();
}

} // namespace

std::optional<FilterConfig> config_from_json(const json& j) {
  if (!j.is_object()) {
    NW_ERROR("config: expected a JSON object, got {}", j.type_name());
    return std::nullopt;
  }

  FilterConfig cfg;
  try {
    read_if_present(j, "retry_interval_ms",         cfg.retry_interval_ms);
    read_if_present(j, "max_retries",               cfg.max_retries);
    read_if_present(j, "tick_interval_ms",          cfg.tick_interval_ms);
    read_if_present(j, "keepalive_interval_ms",     cfg.keepalive_interval_ms);
    read_if_present(j, "endpoint_idle_timeout_ms",  cfg.endpoint_idle_timeout_ms);
    read_if_present(j, "shutdown_drain_timeout_ms", cfg.shutdown_drain_timeout_ms);
    read_if_present(j, "server_version",            cfg.server_version);
    read_if_present(j, "min_client_version",        cfg.min_client_version);
  } catch (const json::exception& e) {
    NW_ERROR("config: {}", e.what());
    return std::nullopt;
  }

  if (!Version::parse(cfg.server_version)) {
    NW_ERROR("config: bad server_version '{}'", cfg.server_version);
    return std::nullopt;
  }
  if (!Version::parse(cfg.min_client_version)) {
    NW_ERROR("config: bad min_client_version '{}'", cfg.min_client_version);
    return std::nullopt;
  }
  if (cfg.retry_interval_ms == 0 || cfg.tick_interval_ms == 0) {
    NW_ERROR("config: retry_interval_ms and tick_interval_ms must be > 0");
    return std::nullopt;
  }
  return cfg;
}

std::optional<FilterConfig> load_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    NW_ERROR("config: cannot open '{}'", path);
    return std::nullopt;
  }

  json j;
  try {
    in >> j;
  } catch (const json::exception& e) {
    NW_ERROR("config: '{}' is not valid JSON: {}", path, e.what());
    return std::nullopt;
  }
  return config_from_json(j);
}

json config_to_json(const FilterConfig& cfg) {
  return json{
      {"retry_interval_ms",         cfg.retry_interval_ms},
      {"max_retries",               cfg.max_retries},
      {"tick_interval_ms",          cfg.tick_interval_ms},
      {"keepalive_interval_ms",     cfg.keepalive_interval_ms},
      {"endpoint_idle_timeout_ms",  cfg.endpoint_idle_timeout_ms},
      {"shutdown_drain_timeout_ms", cfg.shutdown_drain_timeout_ms},
      {"server_version",            cfg.server_version},
      {"min_client_version",        cfg.min_client_version},
  };
}

} // namespace netway
