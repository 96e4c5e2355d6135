/**
 * @file lossy_link.hpp
 * @brief In-process stand-in for the datagram transport, with configurable misbehavior.
 *
 * @details
 * Joins two Filters the way a UDP socket pair would, but inside one process.
 * One pump thread per direction reads `TransportCmd`s from one side and
 * turns every packet of a `SendPackets` into a JSON datagram (see codec.hpp),
 * then mangles the stream before it reaches the other side:
 *
 * | knob        | effect on each datagram                              |
 * |-------------|------------------------------------------------------|
 * | `loss`      | dropped                                              |
 * | `duplicate` | delivered twice                                      |
 * | `reorder`   | held back and delivered after the next datagram      |
 * | `corrupt`   | one byte flipped, so the far side reports it malformed |
 *
 * The far side decodes each datagram and receives a `PacketDelivery` or a
 * `MalformedPacket`. Deliveries use `try_send`: a full notice channel loses
 * the datagram, which is what a real socket buffer does too.
 *
 * `DropPacket` / `DropEndpoint` are only counted; datagrams are not buffered
 * after sending, so there is nothing to release.
 */
#ifndef NETWAY_CLI_LOSSY_LINK_HPP
#define NETWAY_CLI_LOSSY_LINK_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "netway/common.hpp"
#include "netway/messages.hpp"

namespace netway {
namespace sim {

struct LinkConfig {
  double   loss{0.0};
  double   duplicate{0.0};
  double   reorder{0.0};
  double   corrupt{0.0};
  uint32_t seed{1};
};

/// The transport-side channels of one Filter, and the address it has on the link.
struct LinkSide {
  Endpoint                                endpoint;
  std::shared_ptr<TransportCmdChannel>    cmd;
  std::shared_ptr<TransportRspChannel>    rsp;
  std::shared_ptr<TransportNoticeChannel> notice;
};

class LossyLink {
public:
  LossyLink(LinkSide a, LinkSide b, LinkConfig cfg);
  ~LossyLink();

  LossyLink(const LossyLink&) = delete;
  LossyLink& operator=(const LossyLink&) = delete;

  void start();
  void stop();

  /// Counters as a JSON object for the run report.
  nlohmann::json report() const;

private:
  struct Counters {
    std::atomic<uint64_t> datagrams{0};
    std::atomic<uint64_t> lost{0};
    std::atomic<uint64_t> duplicated{0};
    std::atomic<uint64_t> reordered{0};
    std::atomic<uint64_t> corrupted{0};
    std::atomic<uint64_t> overflowed{0};
    std::atomic<uint64_t> drop_packet{0};
    std::atomic<uint64_t> drop_endpoint{0};
  };

  void pump(LinkSide& from, LinkSide& to, uint32_t seed);
  void deliver(const LinkSide& from, const LinkSide& to, const std::string& datagram);

  LinkSide          a_;
  LinkSide          b_;
  LinkConfig        cfg_;
  std::atomic<bool> running_{false};
  std::thread       a_to_b_;
  std::thread       b_to_a_;
  Counters          counters_;
};

} // namespace sim
} // namespace netway

#endif // NETWAY_CLI_LOSSY_LINK_HPP
