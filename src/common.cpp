// -----------------------------------------------------------------------------
// common.cpp: Endpoint formatting and the tracking-id counter.
//
// API & field descriptions:
//   see include/netway/common.hpp
// -----------------------------------------------------------------------------
#include "netway/common.hpp"

#include <atomic>

namespace netway {

TrackingId next_tracking_id() {
  static std::atomic<TrackingId> counter{0};
  return counter.fetch_add(1, std::memory_order_relaxed) + 1;   // first id handed out is 1
}

std::string Endpoint::to_string() const {
  // IPv6 literals need brackets or the port suffix becomes ambiguous
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

} // namespace netway
