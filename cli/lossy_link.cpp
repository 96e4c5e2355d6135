// -----------------------------------------------------------------------------
// lossy_link.cpp: pump threads of the simulated datagram link.
//
// API:
//   see cli/lossy_link.hpp
// -----------------------------------------------------------------------------
#include "lossy_link.hpp"

#include <chrono>
#include <optional>
#include <random>
#include <type_traits>
#include <utility>

#include "netway/codec.hpp"
#include "netway/log.hpp"

namespace netway {
namespace sim {

LossyLink::LossyLink(LinkSide a, LinkSide b, LinkConfig cfg)
: a_(std::move(a)), b_(std::move(b)), cfg_(cfg) {}

LossyLink::~LossyLink() { stop(); }

void LossyLink::start() {
  if (running_.exchange(true)) return;
  a_to_b_ = std::thread([this] { pump(a_, b_, cfg_.seed); });
  b_to_a_ = std::thread([this] { pump(b_, a_, cfg_.seed + 1); });
}

void LossyLink::stop() {
  running_ = false;
  if (a_to_b_.joinable()) a_to_b_.join();
  if (b_to_a_.joinable()) b_to_a_.join();
}

// -----------------------------------------------------------------------------
// pump(): one direction of the link.
// POLICY:
//   - every packet is judged on its own: loss, then corruption, then
//     duplication, then reordering
//   - at most one datagram is held back; it goes out after the next one, or
//     when the direction goes quiet
// -----------------------------------------------------------------------------
void LossyLink::pump(LinkSide& from, LinkSide& to, uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<double> roll(0.0, 1.0);
  std::optional<std::string> held;

  auto flush_held = [&] {
    if (!held) return;
    deliver(from, to, *held);
    held.reset();
  };

  while (running_) {
    TransportCmd cmd;
    if (!from.cmd->recv(cmd, std::chrono::milliseconds(10))) {
      flush_held();                                   // quiet line: release what we held
      continue;
    }

    std::visit([&](auto& c) {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, transport_cmd::SendPackets>) {
        for (const auto& packet : c.packets) {
          ++counters_.datagrams;
          std::string datagram = codec::encode(packet);

          if (roll(rng) < cfg_.loss) { ++counters_.lost; continue; }
          if (roll(rng) < cfg_.corrupt && !datagram.empty()) {
            ++counters_.corrupted;
            datagram[rng() % datagram.size()] ^= 0x5a;
          }
          const bool twice = roll(rng) < cfg_.duplicate;
          if (twice) ++counters_.duplicated;

          if (!held && roll(rng) < cfg_.reorder) {
            ++counters_.reordered;
            held = datagram;
            if (twice) deliver(from, to, datagram);
            continue;
          }
          deliver(from, to, datagram);
          if (twice) deliver(from, to, datagram);
          flush_held();
        }
        if (!from.rsp->try_send(transport_rsp::Accepted{})) {
          NW_TRACE("link: response channel full, Accepted dropped");
        }
      } else if constexpr (std::is_same_v<T, transport_cmd::DropPacket>) {
        ++counters_.drop_packet;
      } else if constexpr (std::is_same_v<T, transport_cmd::DropEndpoint>) {
        ++counters_.drop_endpoint;
      }
    }, cmd);
  }
  flush_held();
}

void LossyLink::deliver(const LinkSide& from, const LinkSide& to, const std::string& datagram) {
  std::string error;
  TransportNotice notice;
  if (auto packet = codec::decode(datagram, &error)) {
    notice = transport_notice::PacketDelivery{from.endpoint, std::move(*packet)};
  } else {
    notice = transport_notice::MalformedPacket{from.endpoint, error};
  }
  if (!to.notice->try_send(std::move(notice))) {
    ++counters_.overflowed;
    NW_DEBUG("link: {} -> {} receive buffer full, datagram lost", from.endpoint.to_string(),
             to.endpoint.to_string());
  }
}

nlohmann::json LossyLink::report() const {
  return nlohmann::json{
      {"datagrams",     counters_.datagrams.load()},
      {"lost",          counters_.lost.load()},
      {"duplicated",    counters_.duplicated.load()},
      {"reordered",     counters_.reordered.load()},
      {"corrupted",     counters_.corrupted.load()},
      {"overflowed",    counters_.overflowed.load()},
      {"drop_packet",   counters_.drop_packet.load()},
      {"drop_endpoint", counters_.drop_endpoint.load()},
  };
}

} // namespace sim
} // namespace netway
