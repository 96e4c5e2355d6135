/**
 * @file common.hpp
 * @brief Endpoint identity and transport tracking ids shared by every netway layer.
 *
 * @details
 * Two small things every other header needs:
 *  - `Endpoint`: the remote peer address (host + port). It is the key of the
 *    Filter's session table, so it is ordered, hashable and printable.
 *  - `TrackingId`: one id per physical send attempt. The Filter hands it to
 *    the transport with `SendPackets` and later uses it to say `DropPacket`.
 *
 * Tracking ids come from `next_tracking_id()`, a process-wide counter. They are
 * never reused inside one process, so a stale `DropPacket` can never hit a
 * newer send.
 */
#ifndef NETWAY_COMMON_HPP
#define NETWAY_COMMON_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace netway {

/// Transport tracking id for one send attempt. 0 is never issued.
using TrackingId = uint64_t;

/**
 * @brief Issue a fresh process-unique tracking id.
 *
 * Thread-safe. Ids start at 1 and only grow.
 */
TrackingId next_tracking_id();

/**
 * @struct Endpoint
 * @brief Address of one remote peer.
 *
 * The host is kept as text (dotted IPv4, IPv6 or a name the transport
 * resolves); the Filter never interprets it.
 */
struct Endpoint {
  std::string host;   ///< Peer address as the transport reports it.
  uint16_t    port{0};///< Peer UDP port.

  Endpoint() = default;
  Endpoint(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

  /// "host:port", or "[host]:port" when the host contains a colon.
  std::string to_string() const;

  bool operator==(const Endpoint& o) const { return port == o.port && host == o.host; }
  bool operator!=(const Endpoint& o) const { return !(*this == o); }
  bool operator<(const Endpoint& o) const {
    return host < o.host || (host == o.host && port < o.port);
  }
};

} // namespace netway

namespace std {
template <>
struct hash<netway::Endpoint> {
  size_t operator()(const netway::Endpoint& e) const noexcept {
    size_t h = std::hash<std::string>{}(e.host);
    return h ^ (static_cast<size_t>(e.port) + 0x9e3779b9 + (h << 6) + (h >> 2));
  }
};
} // namespace std

#endif // NETWAY_COMMON_HPP
