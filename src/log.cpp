// -----------------------------------------------------------------------------
// log.cpp: creation of the shared "netway" spdlog logger.
//
// API:
//   see include/netway/log.hpp
// -----------------------------------------------------------------------------
#include "netway/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace netway {
namespace log {

namespace {

constexpr const char* kLoggerName = "netway";

std::mutex& init_mutex() {
  static std::mutex m;
  return m;
}

std::shared_ptr<spdlog::logger> make_logger(spdlog::level::level_enum level) {
  // reuse a logger someone else registered under our name (e.g. a host app)
  auto existing = spdlog::get(kLoggerName);
  if (existing) {
    existing->set_level(level);
    return existing;
  }
  auto created = spdlog::stdout_color_mt(kLoggerName);
  created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] [thread %t] %v");
  created->set_level(level);
  return created;
}

} // namespace

std::shared_ptr<spdlog::logger>& logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    std::lock_guard<std::mutex> lock(init_mutex());
    return make_logger(spdlog::level::warn);
  }();
  return instance;
}

void init(spdlog::level::level_enum level) {
  auto& l = logger();
  std::lock_guard<std::mutex> lock(init_mutex());
  l->set_level(level);
  l->flush_on(spdlog::level::warn);
}

spdlog::level::level_enum level_from_string(const std::string& name) {
  if (name == "trace")    return spdlog::level::trace;
  if (name == "debug")    return spdlog::level::debug;
  if (name == "info")     return spdlog::level::info;
  if (name == "warn")     return spdlog::level::warn;
  if (name == "error")    return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off")      return spdlog::level::off;
  return spdlog::level::info;
}

} // namespace log
} // namespace netway
