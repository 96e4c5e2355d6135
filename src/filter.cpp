// -----------------------------------------------------------------------------
// filter.cpp: netway Filter engine
//
// API & behavior:
//   see include/netway/filter.hpp (handshake, reliability rules, failure model)
//
// NOTE: Everything in here runs on the engine thread. Sessions are touched by
// nobody else, so there is no locking below this line except inside channels.
// -----------------------------------------------------------------------------
#include "netway/filter.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>
#include <utility>

#include "netway/log.hpp"
#include "netway/version.hpp"

namespace netway {

namespace {

template <class>
inline constexpr bool always_false = false;

// Endpoint a command refers to; Shutdown has none.
Endpoint command_endpoint(const FilterCmd& cmd) {
  return std::visit([](const auto& c) -> Endpoint {
    using T = std::decay_t<decltype(c)>;
    if constexpr (std::is_same_v<T, filter_cmd::Shutdown>) return Endpoint{};
    else return c.endpoint;
  }, cmd);
}

bool is_immediate_shutdown(const FilterCmd& cmd) {
  const auto* s = std::get_if<filter_cmd::Shutdown>(&cmd);
  return s && !s->graceful;
}

} // namespace

const char* to_string(FilterMode m) {
  return m == FilterMode::Server ? "server" : "client";
}

Filter::Filter(std::shared_ptr<TransportCmdChannel>    transport_cmd,
               std::shared_ptr<TransportRspChannel>    transport_rsp,
               std::shared_ptr<TransportNoticeChannel> transport_notice,
               FilterMode                              mode,
               FilterConfig                            config,
               std::shared_ptr<Clock>                  clock)
: transport_cmd_(std::move(transport_cmd)),
  transport_rsp_(std::move(transport_rsp)),
  transport_notice_(std::move(transport_notice)),
  cmd_(std::make_shared<FilterCmdChannel>()),
  rsp_(std::make_shared<FilterRspChannel>()),
  notice_(std::make_shared<FilterNoticeChannel>()),
  wake_(std::make_shared<Signal>()),
  mode_(mode),
  config_(std::move(config)),
  clock_(std::move(clock)),
  rng_(std::random_device{}()) {
  cmd_->set_signal(wake_);
  transport_rsp_->set_signal(wake_);
  transport_notice_->set_signal(wake_);
}

Filter::~Filter() {
  // a watcher must never wait on a Filter that no longer exists
  if (shutdown_.complete()) {
    NW_DEBUG("filter ({}) destroyed before shutdown completed", to_string(mode_));
  }
}

// ---------- public ----------

void Filter::run() {
  NW_INFO("filter ({}) running, retry {}ms x{}, tick {}ms",
          to_string(mode_), config_.retry_interval_ms, config_.max_retries,
          config_.tick_interval_ms);
  for (;;) {
    const uint64_t seen = wake_->generation();   // read before draining: no lost wake-ups
    if (!tick(clock_->now())) break;
    wake_->wait_for(seen, Milliseconds(config_.tick_interval_ms));
  }
  NW_INFO("filter ({}) stopped", to_string(mode_));
}

// -----------------------------------------------------------------------------
// tick(): one engine pass.
// ORDER:
//   1) commands (immediate Shutdown wins over everything)
//   2) transport notices, one at a time; new commands pre-empt the rest
//   3) transport responses
//   4) retry / keep-alive / idle scans
//   5) sweep drained Closing sessions, maybe finish a graceful shutdown
// -----------------------------------------------------------------------------
bool Filter::tick(TimePoint now) {
  if (stopped_) return false;

  for (;;) {
    if (!drain_commands(now)) return false;

    bool commands_waiting = false;
    TransportNotice notice;
    while (transport_notice_->try_recv(notice)) {
      handle_notice(notice, now);
      if (!cmd_->empty()) { commands_waiting = true; break; }
    }
    if (!commands_waiting) break;
  }

  drain_transport_responses();
  service_timers(now);
  sweep_closing();

  if (shutting_down_) {
    const bool deadline_passed = drain_deadline_ && now >= *drain_deadline_;
    if (sessions_.empty() || deadline_passed) {
      if (!sessions_.empty()) {
        NW_WARN("shutdown drain timed out with {} session(s) still holding packets",
                sessions_.size());
      }
      finish();
      return false;
    }
  }
  return true;
}

FilterStats Filter::stats() const {
  FilterStats s;
  s.packets_sent     = counters_.packets_sent.load();
  s.retransmissions  = counters_.retransmissions.load();
  s.duplicates       = counters_.duplicates.load();
  s.out_of_order     = counters_.out_of_order.load();
  s.packets_acked    = counters_.packets_acked.load();
  s.malformed        = counters_.malformed.load();
  s.peer_rejections  = counters_.peer_rejections.load();
  s.endpoints_failed = counters_.endpoints_failed.load();
  return s;
}

const Session* Filter::session(const Endpoint& ep) const {
  auto it = sessions_.find(ep);
  return it == sessions_.end() ? nullptr : &it->second;
}

// ---------- loop stages ----------

bool Filter::drain_commands(TimePoint now) {
  std::vector<FilterCmd> batch;
  FilterCmd cmd;
  while (cmd_->try_recv(cmd)) batch.push_back(std::move(cmd));
  if (batch.empty()) return true;

  for (const auto& c : batch) {
    if (!is_immediate_shutdown(c)) continue;
    NW_INFO("immediate shutdown requested");
    for (const auto& other : batch) {
      if (std::holds_alternative<filter_cmd::Shutdown>(other)) continue;
      reply(filter_rsp::Rejected{command_endpoint(other), FilterError::ShuttingDown,
                                 "filter stopped before the command ran"});
    }
    finish();
    return false;
  }

  for (auto& c : batch) {
    if (shutting_down_) {
      if (!std::holds_alternative<filter_cmd::Shutdown>(c)) {
        reply(filter_rsp::Rejected{command_endpoint(c), FilterError::ShuttingDown,
                                   "command queued after shutdown"});
      }
      continue;
    }
    handle_command(c, now);
  }
  return true;
}

void Filter::handle_command(FilterCmd& cmd, TimePoint now) {
  std::visit([&](auto& c) {
    using T = std::decay_t<decltype(c)>;
    if constexpr (std::is_same_v<T, filter_cmd::SendRequestAction>) {
      on_send_request(c, now);
    } else if constexpr (std::is_same_v<T, filter_cmd::SendResponseCode>) {
      on_send_response(c, now);
    } else if constexpr (std::is_same_v<T, filter_cmd::DropEndpoint>) {
      on_drop_endpoint(c);
    } else if constexpr (std::is_same_v<T, filter_cmd::Shutdown>) {
      begin_graceful_shutdown(now);   // immediate ones never get here
    } else {
      static_assert(always_false<T>, "unhandled FilterCmd");
    }
  }, cmd);
}

void Filter::handle_notice(TransportNotice& notice, TimePoint now) {
  std::visit([&](auto& n) {
    using T = std::decay_t<decltype(n)>;
    if constexpr (std::is_same_v<T, transport_notice::PacketDelivery>) {
      if (const auto* req = std::get_if<Request>(&n.packet)) {
        if (mode_ == FilterMode::Server) { on_request(n.endpoint, *req, now); return; }
      } else if (mode_ == FilterMode::Client) {
        on_response(n.endpoint, std::get<Response>(n.packet), now);
        return;
      }
      ++counters_.malformed;
      NW_WARN("{}: {} packet reached a {} filter, dropped", n.endpoint.to_string(),
              std::holds_alternative<Request>(n.packet) ? "request" : "response",
              to_string(mode_));
    } else if constexpr (std::is_same_v<T, transport_notice::MalformedPacket>) {
      ++counters_.malformed;
      NW_WARN("{}: malformed packet dropped: {}", n.endpoint.to_string(), n.detail);
    } else {
      static_assert(always_false<T>, "unhandled TransportNotice");
    }
  }, notice);
}

void Filter::drain_transport_responses() {
  TransportRsp rsp;
  while (transport_rsp_->try_recv(rsp)) {
    std::visit([](const auto& r) {
      using T = std::decay_t<decltype(r)>;
      if constexpr (std::is_same_v<T, transport_rsp::Accepted>) {
        NW_TRACE("transport accepted command");
      } else if constexpr (std::is_same_v<T, transport_rsp::BufferFull>) {
        // the packets stay in flight; the retry scan sends them again
        NW_WARN("{}: transport buffer full", r.endpoint.to_string());
      } else if constexpr (std::is_same_v<T, transport_rsp::EndpointNotFound>) {
        NW_WARN("{}: transport does not know this endpoint", r.endpoint.to_string());
      } else {
        static_assert(always_false<T>, "unhandled TransportRsp");
      }
    }, rsp);
  }
}

// -----------------------------------------------------------------------------
// service_timers(): time-driven work for every session.
// POLICY (per session, in this order):
//   - server: idle timeout (0 disables) fails the endpoint. Clients only hear
//     from the server when it answers, so they rely on the retry limit.
//   - a packet due again after max_retries resends fails the endpoint
//   - everything else that is due is resent in one SendPackets
//   - Established client sessions quiet for keepalive_interval send KeepAlive
// -----------------------------------------------------------------------------
void Filter::service_timers(TimePoint now) {
  const Milliseconds retry_interval(config_.retry_interval_ms);
  const Milliseconds idle_timeout(config_.endpoint_idle_timeout_ms);
  const Milliseconds keepalive(config_.keepalive_interval_ms);

  std::vector<Endpoint> endpoints;
  endpoints.reserve(sessions_.size());
  for (const auto& kv : sessions_) endpoints.push_back(kv.first);

  for (const auto& ep : endpoints) {
    auto it = sessions_.find(ep);
    if (it == sessions_.end()) continue;
    Session& s = it->second;

    if (mode_ == FilterMode::Server && config_.endpoint_idle_timeout_ms > 0 &&
        now - s.last_recv_time() >= idle_timeout) {
      fail_endpoint(ep, FailReason::IdleTimeout);
      continue;
    }
    if (s.exhausted(now, retry_interval, config_.max_retries)) {
      fail_endpoint(ep, FailReason::RetryLimit);
      continue;
    }

    const auto due = s.due_for_retry(now, retry_interval);
    if (!due.empty()) {
      transport_cmd::SendPackets batch;
      batch.endpoint = ep;
      for (TrackingId old_tid : due) {
        const auto tid = s.retransmit(old_tid, now);
        if (!tid) continue;
        const InflightEntry* e = s.find_inflight(*tid);
        batch.packets.push_back(e->packet);
        batch.packet_infos.push_back(PacketInfo{*tid, e->retry_count});
        NW_DEBUG("{}: resend seq {} (try {}), tid {} -> {}", ep.to_string(), e->sequence,
                 e->retry_count, old_tid, *tid);
      }
      counters_.retransmissions += batch.packets.size();
      to_transport(std::move(batch));
    }

    if (mode_ == FilterMode::Client && s.phase() == SessionPhase::Established &&
        now - s.last_send_time() >= keepalive) {
      action::KeepAlive ka;
      ka.latest_response_ack = s.highest_recv_seq().value_or(0);
      Request req;
      req.action = ka;
      send_untracked(s, std::move(req), now);
    }
  }
}

void Filter::sweep_closing() {
  std::vector<Endpoint> drained;
  for (const auto& kv : sessions_) {
    if (kv.second.phase() == SessionPhase::Closing && kv.second.inflight().empty()) {
      drained.push_back(kv.first);
    }
  }
  for (const auto& ep : drained) {
    NW_DEBUG("{}: drained, session closed", ep.to_string());
    remove_session(ep);
  }
}

void Filter::begin_graceful_shutdown(TimePoint now) {
  NW_INFO("graceful shutdown: draining {} session(s)", sessions_.size());
  shutting_down_  = true;
  drain_deadline_ = now + Milliseconds(config_.shutdown_drain_timeout_ms);
  cmd_->close();                                 // later sends fail at the caller
  for (auto& kv : sessions_) kv.second.set_phase(SessionPhase::Closing);
}

void Filter::finish() {
  for (const auto& kv : sessions_) {
    // the transport may already be gone; never block here
    if (!transport_cmd_->try_send(transport_cmd::DropEndpoint{kv.first})) {
      NW_DEBUG("{}: DropEndpoint not delivered at shutdown", kv.first.to_string());
    }
  }
  sessions_.clear();
  shutting_down_ = true;
  cmd_->close();
  rsp_->close();
  notice_->close();
  stopped_ = true;
  shutdown_.complete();
}

// ---------- commands ----------

// -----------------------------------------------------------------------------
// on_send_request(): client mode only.
// POLICY:
//   - Connect to an unknown endpoint opens a session in Connecting.
//   - Anything else to an unknown endpoint -> NoSuchEndpoint.
//   - Before LoggedIn only Disconnect may follow the Connect.
//   - KeepAlive and Disconnect go out untracked; Disconnect also ends the session.
// -----------------------------------------------------------------------------
void Filter::on_send_request(filter_cmd::SendRequestAction& cmd, TimePoint now) {
  if (mode_ != FilterMode::Client) {
    reply(filter_rsp::Rejected{cmd.endpoint, FilterError::WrongMode,
                               "requests are sent by client filters"});
    return;
  }

  const bool is_connect    = std::holds_alternative<action::Connect>(cmd.action);
  const bool is_disconnect = std::holds_alternative<action::Disconnect>(cmd.action);

  auto it = sessions_.find(cmd.endpoint);
  if (it == sessions_.end()) {
    if (!is_connect) {
      reply(filter_rsp::NoSuchEndpoint{cmd.endpoint});
      return;
    }
    it = sessions_.emplace(cmd.endpoint,
                           Session(cmd.endpoint, SessionRole::Requester,
                                   SessionPhase::Connecting, now)).first;
    NW_INFO("{}: connecting", cmd.endpoint.to_string());
    Request req;
    req.action = std::move(cmd.action);
    send_tracked(it->second, std::move(req), now);
    return;
  }

  Session& s = it->second;
  if (s.phase() == SessionPhase::Closing) {
    reply(filter_rsp::Rejected{cmd.endpoint, FilterError::InvalidPhase, "session is closing"});
    return;
  }
  if (is_connect) {
    reply(filter_rsp::Rejected{cmd.endpoint, FilterError::InvalidPhase,
                               "session already exists"});
    return;
  }
  if (s.phase() == SessionPhase::Connecting && !is_disconnect) {
    reply(filter_rsp::Rejected{cmd.endpoint, FilterError::InvalidPhase,
                               "not logged in yet"});
    return;
  }

  Request req;
  if (auto* ka = std::get_if<action::KeepAlive>(&cmd.action)) {
    ka->latest_response_ack = s.highest_recv_seq().value_or(0);
  }
  req.action = std::move(cmd.action);

  if (is_disconnect) {
    send_untracked(s, std::move(req), now);
    NW_INFO("{}: disconnected", cmd.endpoint.to_string());
    remove_session(cmd.endpoint);
  } else if (std::holds_alternative<action::KeepAlive>(req.action)) {
    send_untracked(s, std::move(req), now);
  } else {
    send_tracked(s, std::move(req), now);
  }
}

// -----------------------------------------------------------------------------
// on_send_response(): server mode only.
// POLICY:
//   - LoggedIn completes the handshake and is only valid while Connecting.
//     Empty cookie -> the minted one. Empty server_version -> config value.
//   - Other codes need a session past Unauthenticated.
// -----------------------------------------------------------------------------
void Filter::on_send_response(filter_cmd::SendResponseCode& cmd, TimePoint now) {
  if (mode_ != FilterMode::Server) {
    reply(filter_rsp::Rejected{cmd.endpoint, FilterError::WrongMode,
                               "responses are sent by server filters"});
    return;
  }

  auto it = sessions_.find(cmd.endpoint);
  if (it == sessions_.end()) {
    reply(filter_rsp::NoSuchEndpoint{cmd.endpoint});
    return;
  }
  Session& s = it->second;

  if (s.phase() == SessionPhase::Unauthenticated || s.phase() == SessionPhase::Closing) {
    reply(filter_rsp::Rejected{cmd.endpoint, FilterError::InvalidPhase,
                               std::string("session is ") + to_string(s.phase())});
    return;
  }

  if (auto* logged_in = std::get_if<code::LoggedIn>(&cmd.code)) {
    if (s.phase() != SessionPhase::Connecting) {
      reply(filter_rsp::Rejected{cmd.endpoint, FilterError::InvalidPhase,
                                 "LoggedIn outside of the handshake"});
      return;
    }
    if (logged_in->cookie.empty()) logged_in->cookie = s.pending_cookie();
    if (logged_in->server_version.empty()) logged_in->server_version = config_.server_version;
    s.set_cookie(logged_in->cookie);
    s.set_pending_cookie(std::string());
    s.set_phase(SessionPhase::Established);
    NW_INFO("{}: logged in", cmd.endpoint.to_string());
  }

  Response rsp;
  rsp.code = std::move(cmd.code);
  send_tracked(s, std::move(rsp), now);
}

void Filter::on_drop_endpoint(const filter_cmd::DropEndpoint& cmd) {
  if (sessions_.find(cmd.endpoint) == sessions_.end()) {
    reply(filter_rsp::NoSuchEndpoint{cmd.endpoint});
    return;
  }
  NW_INFO("{}: dropped by application", cmd.endpoint.to_string());
  remove_session(cmd.endpoint);
}

// ---------- inbound ----------

// -----------------------------------------------------------------------------
// on_request(): server side of every inbound request.
// ORDER:
//   1) unseen endpoint -> new Unauthenticated session (not while shutting down)
//   2) duplicate sequence -> drop, before any cookie check
//   3) Closing -> apply the ack fields only; the sequence is not recorded
//   4) Connect -> handshake
//   5) no handshake yet -> Unauthorized; wrong cookie -> Unauthorized
//   6) accept: apply acks, then Disconnect / KeepAlive / surface to the app
// -----------------------------------------------------------------------------
void Filter::on_request(const Endpoint& ep, const Request& req, TimePoint now) {
  auto it = sessions_.find(ep);
  if (it == sessions_.end()) {
    if (shutting_down_) {
      NW_DEBUG("{}: request from new endpoint ignored during shutdown", ep.to_string());
      return;
    }
    it = sessions_.emplace(ep, Session(ep, SessionRole::Responder,
                                       SessionPhase::Unauthenticated, now)).first;
  }
  Session& s = it->second;

  if (s.classify(req.sequence) == InboundClass::Duplicate) {
    ++counters_.duplicates;
    NW_TRACE("{}: duplicate request seq {} dropped", ep.to_string(), req.sequence);
    return;
  }

  if (s.phase() == SessionPhase::Closing) {
    // the request is never surfaced, so its sequence must not be acked
    if (s.cookie().empty() || req.cookie == s.cookie()) {
      std::vector<TrackingId> released;
      if (req.response_ack) released = s.acknowledge(*req.response_ack);
      if (const auto* ka = std::get_if<action::KeepAlive>(&req.action)) {
        auto more = s.acknowledge(ka->latest_response_ack);
        released.insert(released.end(), more.begin(), more.end());
      }
      release(ep, released);
    }
    NW_DEBUG("{}: {} seq {} ignored while closing", ep.to_string(), action_name(req.action),
             req.sequence);
    return;
  }

  if (const auto* c = std::get_if<action::Connect>(&req.action)) {
    on_connect(s, req, *c, now);
    return;
  }

  if (s.phase() != SessionPhase::Established) {
    s.observe_inbound(req.sequence, req.response_ack, now);
    NW_WARN("{}: {} before login", ep.to_string(), action_name(req.action));
    const bool unauthenticated = s.phase() == SessionPhase::Unauthenticated;
    reject_peer(s, code::Unauthorized{"login required"}, now);
    if (unauthenticated) remove_session(ep);
    return;
  }

  if (req.cookie != s.cookie()) {
    NW_WARN("{}: bad cookie on {}", ep.to_string(), action_name(req.action));
    reject_peer(s, code::Unauthorized{"invalid cookie"}, now);
    return;
  }

  InboundResult in = s.observe_inbound(req.sequence, req.response_ack, now);
  if (in.cls == InboundClass::OutOfOrder) {
    ++counters_.out_of_order;
    NW_DEBUG("{}: request seq {} skipped ahead", ep.to_string(), req.sequence);
  }
  if (const auto* ka = std::get_if<action::KeepAlive>(&req.action)) {
    auto more = s.acknowledge(ka->latest_response_ack);
    in.released.insert(in.released.end(), more.begin(), more.end());
  }
  release(ep, in.released);

  if (std::holds_alternative<action::KeepAlive>(req.action)) return;

  if (std::holds_alternative<action::Disconnect>(req.action)) {
    NW_INFO("{}: peer disconnected", ep.to_string());
    to_app(filter_notice::NewRequestAction{ep, req.action});
    remove_session(ep);
    return;
  }

  to_app(filter_notice::NewRequestAction{ep, req.action});
}

void Filter::on_connect(Session& s, const Request& req, const action::Connect& c, TimePoint now) {
  const Endpoint ep = s.endpoint();
  s.observe_inbound(req.sequence, req.response_ack, now);

  if (s.phase() != SessionPhase::Unauthenticated) {
    NW_WARN("{}: Connect on a session that is already {}", ep.to_string(),
            to_string(s.phase()));
    return;
  }

  if (!is_client_compatible(c.client_version, config_.min_client_version)) {
    NW_WARN("{}: client version '{}' rejected (min {})", ep.to_string(), c.client_version,
            config_.min_client_version);
    reject_peer(s, code::IncompatibleVersion{config_.server_version}, now);
    remove_session(ep);
    return;
  }

  s.set_pending_cookie(mint_cookie());
  s.set_phase(SessionPhase::Connecting);
  NW_INFO("{}: connect from '{}' ({})", ep.to_string(), c.name, c.client_version);
  to_app(filter_notice::NewRequestAction{ep, req.action});
}

// -----------------------------------------------------------------------------
// on_response(): client side of every inbound response.
// POLICY:
//   - responses from endpoints we never connected to are dropped
//   - Closing: only request_ack is applied, the response is not recorded
//   - LoggedIn while Connecting stores the cookie
//   - IncompatibleVersion / Unauthorized while Connecting end the session
//     after the app has seen them
// -----------------------------------------------------------------------------
void Filter::on_response(const Endpoint& ep, const Response& rsp, TimePoint now) {
  auto it = sessions_.find(ep);
  if (it == sessions_.end()) {
    NW_WARN("{}: response from unknown server dropped", ep.to_string());
    return;
  }
  Session& s = it->second;

  if (s.classify(rsp.sequence) == InboundClass::Duplicate) {
    ++counters_.duplicates;
    NW_TRACE("{}: duplicate response seq {} dropped", ep.to_string(), rsp.sequence);
    return;
  }

  if (s.phase() == SessionPhase::Closing) {
    if (rsp.request_ack) release(ep, s.acknowledge(*rsp.request_ack));
    NW_DEBUG("{}: response seq {} ignored while closing", ep.to_string(), rsp.sequence);
    return;
  }

  InboundResult in = s.observe_inbound(rsp.sequence, rsp.request_ack, now);
  if (in.cls == InboundClass::OutOfOrder) {
    ++counters_.out_of_order;
    NW_DEBUG("{}: response seq {} skipped ahead", ep.to_string(), rsp.sequence);
  }
  release(ep, in.released);

  bool close_after = false;
  if (s.phase() == SessionPhase::Connecting) {
    if (const auto* li = std::get_if<code::LoggedIn>(&rsp.code)) {
      s.set_cookie(li->cookie);
      s.set_phase(SessionPhase::Established);
      NW_INFO("{}: logged in (server {})", ep.to_string(), li->server_version);
    } else if (std::holds_alternative<code::IncompatibleVersion>(rsp.code) ||
               std::holds_alternative<code::Unauthorized>(rsp.code)) {
      NW_WARN("{}: login refused: {}", ep.to_string(), to_string(rsp.code));
      close_after = true;
    }
  }

  to_app(filter_notice::NewResponseCode{ep, rsp.code});
  if (close_after) remove_session(ep);
}

// ---------- outbound helpers ----------

void Filter::send_tracked(Session& s, Packet packet, TimePoint now) {
  const TrackingId tid = s.register_outbound(std::move(packet), now);
  const InflightEntry* e = s.find_inflight(tid);

  transport_cmd::SendPackets cmd;
  cmd.endpoint = s.endpoint();
  cmd.packets.push_back(e->packet);
  cmd.packet_infos.push_back(PacketInfo{tid, 0});
  NW_DEBUG("{}: send seq {} tid {} {}", s.endpoint().to_string(), e->sequence, tid,
           to_string(e->packet));
  ++counters_.packets_sent;
  to_transport(std::move(cmd));
}

void Filter::send_untracked(Session& s, Packet packet, TimePoint now) {
  transport_cmd::SendPackets cmd;
  cmd.endpoint = s.endpoint();
  cmd.packets.push_back(s.stamp_unreliable(std::move(packet), now));
  cmd.packet_infos.push_back(PacketInfo{next_tracking_id(), 0});
  NW_DEBUG("{}: send untracked {}", s.endpoint().to_string(), to_string(cmd.packets.front()));
  ++counters_.packets_sent;
  to_transport(std::move(cmd));
}

void Filter::reject_peer(Session& s, ResponseCode code, TimePoint now) {
  ++counters_.peer_rejections;
  Response rsp;
  rsp.code = std::move(code);
  send_untracked(s, std::move(rsp), now);
}

void Filter::release(const Endpoint& ep, const std::vector<TrackingId>& tids) {
  for (TrackingId tid : tids) {
    ++counters_.packets_acked;
    to_transport(transport_cmd::DropPacket{ep, tid});
  }
}

void Filter::to_transport(TransportCmd cmd) {
  if (!transport_cmd_->send(std::move(cmd))) {
    NW_ERROR("transport command channel closed; command lost");
  }
}

void Filter::to_app(FilterNotice notice) {
  if (!notice_->send(std::move(notice))) {
    NW_ERROR("application notice channel closed; notice lost");
  }
}

void Filter::reply(FilterRsp rsp) {
  std::visit([](const auto& r) {
    using T = std::decay_t<decltype(r)>;
    if constexpr (std::is_same_v<T, filter_rsp::Rejected>) {
      NW_WARN("{}: command rejected ({}): {}", r.endpoint.to_string(), to_string(r.error),
              r.detail);
    } else {
      NW_WARN("{}: no such endpoint", r.endpoint.to_string());
    }
  }, rsp);
  if (!rsp_->try_send(std::move(rsp))) {
    NW_WARN("application response channel full or closed; response dropped");
  }
}

// ---------- session teardown ----------

void Filter::remove_session(const Endpoint& ep) {
  auto it = sessions_.find(ep);
  if (it == sessions_.end()) return;
  for (TrackingId tid : it->second.clear_inflight()) {
    to_transport(transport_cmd::DropPacket{ep, tid});
  }
  to_transport(transport_cmd::DropEndpoint{ep});
  sessions_.erase(it);
}

void Filter::fail_endpoint(const Endpoint& ep, FailReason reason) {
  NW_WARN("{}: endpoint failed ({})", ep.to_string(), to_string(reason));
  ++counters_.endpoints_failed;
  remove_session(ep);
  to_app(filter_notice::EndpointFailed{ep, reason});
}

std::string Filter::mint_cookie() {
  std::ostringstream os;
  os << std::hex << std::setfill('0')
     << std::setw(16) << rng_()
     << std::setw(16) << rng_();
  return os.str();
}

} // namespace netway
