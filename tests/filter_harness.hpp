// Shared fixture for the Filter engine tests: one Filter wired to in-memory
// transport channels and a ManualClock, plus helpers to read what it emitted.
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "netway/clock.hpp"
#include "netway/filter.hpp"
#include "netway/messages.hpp"

namespace nwtest {

using namespace netway;

inline Request make_request(uint64_t seq, RequestAction action,
                            std::optional<uint64_t> response_ack = std::nullopt,
                            std::optional<std::string> cookie = std::nullopt) {
  Request r;
  r.sequence     = seq;
  r.response_ack = response_ack;
  r.cookie       = std::move(cookie);
  r.action       = std::move(action);
  return r;
}

inline Response make_response(uint64_t seq, ResponseCode code,
                              std::optional<uint64_t> request_ack = std::nullopt) {
  Response r;
  r.sequence    = seq;
  r.request_ack = request_ack;
  r.code        = std::move(code);
  return r;
}

struct Harness {
  std::shared_ptr<TransportCmdChannel>    tcmd    = std::make_shared<TransportCmdChannel>();
  std::shared_ptr<TransportRspChannel>    trsp    = std::make_shared<TransportRspChannel>();
  std::shared_ptr<TransportNoticeChannel> tnotice = std::make_shared<TransportNoticeChannel>();
  std::shared_ptr<ManualClock>            clock   = std::make_shared<ManualClock>();
  Filter                                  filter;

  explicit Harness(FilterMode mode, FilterConfig cfg = FilterConfig{})
  : filter(tcmd, trsp, tnotice, mode, cfg, clock) {}

  bool tick() { return filter.tick(clock->now()); }
  void advance(uint32_t ms) { clock->advance(Milliseconds(ms)); }

  void deliver(const Endpoint& ep, Packet p) {
    tnotice->send(transport_notice::PacketDelivery{ep, std::move(p)});
  }
  void command(FilterCmd c) { filter.cmd_channel()->send(std::move(c)); }

  std::vector<TransportCmd> transport() {
    std::vector<TransportCmd> out;
    TransportCmd c;
    while (tcmd->try_recv(c)) out.push_back(std::move(c));
    return out;
  }
  std::vector<FilterNotice> notices() {
    std::vector<FilterNotice> out;
    FilterNotice n;
    while (filter.notice_channel()->try_recv(n)) out.push_back(std::move(n));
    return out;
  }
  std::vector<FilterRsp> responses() {
    std::vector<FilterRsp> out;
    FilterRsp r;
    while (filter.rsp_channel()->try_recv(r)) out.push_back(std::move(r));
    return out;
  }
};

template <typename T>
std::vector<T> only(const std::vector<TransportCmd>& cmds) {
  std::vector<T> out;
  for (const auto& c : cmds) {
    if (const auto* x = std::get_if<T>(&c)) out.push_back(*x);
  }
  return out;
}

template <typename T>
std::vector<T> only(const std::vector<FilterNotice>& notices) {
  std::vector<T> out;
  for (const auto& n : notices) {
    if (const auto* x = std::get_if<T>(&n)) out.push_back(*x);
  }
  return out;
}

/// Every packet in every SendPackets, in order.
inline std::vector<Packet> sent_packets(const std::vector<TransportCmd>& cmds) {
  std::vector<Packet> out;
  for (const auto& s : only<transport_cmd::SendPackets>(cmds)) {
    out.insert(out.end(), s.packets.begin(), s.packets.end());
  }
  return out;
}

/// Bring a server filter to Established with `ep`; returns the cookie.
inline std::string establish_server(Harness& h, const Endpoint& ep,
                                    const std::string& cookie = "c00k1e") {
  h.deliver(ep, make_request(1, action::Connect{"alice", "0.3.2"}));
  h.tick();
  h.notices();
  h.command(filter_cmd::SendResponseCode{ep, code::LoggedIn{cookie, "0.3.2"}});
  h.tick();
  h.transport();
  return cookie;
}

/// Bring a client filter to Established with `ep`.
inline void establish_client(Harness& h, const Endpoint& ep, const std::string& cookie = "c00k1e") {
  h.command(filter_cmd::SendRequestAction{ep, action::Connect{"alice", "0.3.2"}});
  h.tick();
  h.transport();
  h.deliver(ep, make_response(1, code::LoggedIn{cookie, "0.3.2"}, 1));
  h.tick();
  h.transport();
  h.notices();
}

} // namespace nwtest
