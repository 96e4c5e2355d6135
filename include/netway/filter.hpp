/**
 * @file filter.hpp
 * @brief netway Filter: the reliability and session layer between the application and the datagram transport.
 *
 * @details
 * ## Field Brief
 * The transport below moves datagrams and nothing more: packets get lost,
 * doubled, and shuffled. The application above wants requests and responses
 * that arrive once, in order, from a peer that logged in. The **Filter** sits
 * in between and pays for that difference with sequence numbers, piggy-backed
 * acks, a retransmission set per peer, and a three-step handshake.
 *
 * ---
 *
 * @par What This File Provides
 * - `netway::Filter`: the engine. It owns every `Session`, reads commands
 *   from the application and notices from the transport, and writes the
 *   resulting transport commands and application notices.
 * - `FilterMode`: `Server` (answers requests, many peers) or `Client`
 *   (sends requests, normally one peer).
 * - `FilterStats`: counters for tests and the soak tool.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *   [Application]                 [Filter]                      [Transport]
 *        │  cmd_channel()  ──►  drain commands                        │
 *        │                      (non-graceful Shutdown first)         │
 *        │                             │                              │
 *        │                      one notice at a time  ◄── PacketDelivery
 *        │                      (re-check commands between notices)   │
 *        │                             │                              │
 *        │  ◄── notice_channel()  NewRequestAction / NewResponseCode   │
 *        │                      SendPackets / DropPacket  ──────────► │
 *        │                             │                              │
 *        │                      retry scan, keep-alive, idle scan     │
 *        │                      sweep drained Closing sessions        │
 * ```
 * `tick(now)` does one pass of the diagram without blocking. `run()` loops
 * `tick()` on the calling thread and sleeps on a wake signal shared by the
 * three inbound channels, never longer than `tick_interval_ms`.
 *
 * ---
 *
 * @par Handshake
 * ```
 *   client                                   server
 *   Request{seq 1, Connect{name, ver}}  ──►  Unauthenticated → Connecting
 *                                            (cookie minted, app sees Connect)
 *                                       ◄──  app: SendResponseCode{LoggedIn}
 *   Connecting → Established                 Connecting → Established
 *   Request{seq 2, cookie, ...}         ──►  cookie checked on every request
 * ```
 * - The server app may leave `LoggedIn.cookie` empty; the minted cookie is
 *   filled in. A non-empty cookie is adopted as-is.
 * - An incompatible client version is answered with `IncompatibleVersion`
 *   and the session is removed.
 * - Any request other than `Connect` before the handshake, or with the wrong
 *   cookie after it, is answered with `Unauthorized`.
 *
 * ---
 *
 * @par Reliability Rules
 * - New packets get `next_send_seq` and the highest sequence received from
 *   the peer as their ack. Tracked packets stay in flight until acked.
 * - Rejections to peers (`Unauthorized`, `IncompatibleVersion`), client
 *   `KeepAlive` and client `Disconnect` are sent once, untracked. They still
 *   consume a sequence.
 * - A tracked packet older than `retry_interval_ms` is resent with the same
 *   sequence under a new tracking id and `retry_count + 1`. No DropPacket is
 *   sent for the superseded tracking id; the transport treats a DropPacket
 *   for an id it no longer holds as a no-op.
 * - When a packet comes due again after `max_retries` resends the endpoint
 *   fails: one `EndpointFailed{RetryLimit}`, a DropPacket for every packet
 *   still in flight, a transport `DropEndpoint`, and the session is gone.
 * - Out-of-order packets are delivered at once; see session.hpp.
 *
 * ---
 *
 * @par Failure Model
 * - **Malformed datagram:** logged, counted, dropped.
 * - **Packet of the wrong role** (a Response reaching a server): logged, dropped.
 * - **Misused command:** `FilterRsp::Rejected` or `NoSuchEndpoint` on the
 *   response channel. The Filter never blocks on that channel; if it is full
 *   the response is logged and dropped.
 * - **Shutdown:** the command channel is closed, so `send()` on it returns
 *   false. Commands still queued behind a Shutdown are answered with
 *   `Rejected{ShuttingDown}`.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * auto tcmd    = std::make_shared<netway::TransportCmdChannel>();
 * auto trsp    = std::make_shared<netway::TransportRspChannel>();
 * auto tnotice = std::make_shared<netway::TransportNoticeChannel>();
 *
 * netway::Filter filter(tcmd, trsp, tnotice, netway::FilterMode::Server);
 * auto done = filter.get_shutdown_watcher();
 * std::thread engine([&] { filter.run(); });
 *
 * filter.cmd_channel()->send(netway::filter_cmd::Shutdown{true});
 * done.wait();
 * engine.join();
 * @endcode
 *
 * @note Session state is owned by whichever thread calls tick()/run().
 *       `session()` and `session_count()` are only safe from that thread,
 *       or while the engine is not running.
 */
#ifndef NETWAY_FILTER_HPP
#define NETWAY_FILTER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "netway/clock.hpp"
#include "netway/common.hpp"
#include "netway/config.hpp"
#include "netway/messages.hpp"
#include "netway/session.hpp"
#include "netway/shutdown.hpp"

namespace netway {

enum class FilterMode : uint8_t {
  Server,
  Client,
};

const char* to_string(FilterMode m);

/// Snapshot of the engine counters.
struct FilterStats {
  uint64_t packets_sent{0};      ///< first sends, tracked and untracked
  uint64_t retransmissions{0};
  uint64_t duplicates{0};        ///< inbound packets dropped as already seen
  uint64_t out_of_order{0};      ///< inbound packets that skipped ahead
  uint64_t packets_acked{0};     ///< in-flight entries released by an ack
  uint64_t malformed{0};         ///< MalformedPacket notices plus wrong-role packets
  uint64_t peer_rejections{0};   ///< Unauthorized / IncompatibleVersion sent
  uint64_t endpoints_failed{0};  ///< EndpointFailed notices emitted
};

class Filter {
public:
  Filter(std::shared_ptr<TransportCmdChannel>    transport_cmd,
         std::shared_ptr<TransportRspChannel>    transport_rsp,
         std::shared_ptr<TransportNoticeChannel> transport_notice,
         FilterMode                              mode,
         FilterConfig                            config = FilterConfig{},
         std::shared_ptr<Clock>                  clock  = std::make_shared<SteadyClock>());
  ~Filter();

  Filter(const Filter&) = delete;
  Filter& operator=(const Filter&) = delete;

  // ---------- application side ----------

  std::shared_ptr<FilterCmdChannel>    cmd_channel() const    { return cmd_; }
  std::shared_ptr<FilterRspChannel>    rsp_channel() const    { return rsp_; }
  std::shared_ptr<FilterNoticeChannel> notice_channel() const { return notice_; }

  /// Resolves once the engine stopped. Callable before run().
  ShutdownWatcher get_shutdown_watcher() const { return shutdown_.watcher(); }

  // ---------- driving the engine ----------

  /// Loop tick() until a Shutdown completes. Blocks the calling thread.
  void run();

  /**
   * @brief One non-blocking engine pass at time `now`.
   * @retval true  Still running.
   * @retval false Stopped (this call or an earlier one).
   */
  bool tick(TimePoint now);

  bool is_stopped() const { return stopped_.load(); }

  // ---------- inspection ----------

  FilterMode mode() const { return mode_; }
  const FilterConfig& config() const { return config_; }
  FilterStats stats() const;

  /// Session for `ep`, or nullptr. Engine thread only.
  const Session* session(const Endpoint& ep) const;
  size_t session_count() const { return sessions_.size(); }

private:
  // ---------- loop stages ----------
  bool drain_commands(TimePoint now);        ///< false when an immediate Shutdown was found
  void handle_command(FilterCmd& cmd, TimePoint now);
  void handle_notice(TransportNotice& notice, TimePoint now);
  void drain_transport_responses();
  void service_timers(TimePoint now);
  void sweep_closing();
  void begin_graceful_shutdown(TimePoint now);
  void finish();

  // ---------- commands ----------
  void on_send_request(filter_cmd::SendRequestAction& cmd, TimePoint now);
  void on_send_response(filter_cmd::SendResponseCode& cmd, TimePoint now);
  void on_drop_endpoint(const filter_cmd::DropEndpoint& cmd);

  // ---------- inbound ----------
  void on_request(const Endpoint& ep, const Request& req, TimePoint now);
  void on_response(const Endpoint& ep, const Response& rsp, TimePoint now);
  void on_connect(Session& s, const Request& req, const action::Connect& c, TimePoint now);

  // ---------- outbound helpers ----------
  void send_tracked(Session& s, Packet packet, TimePoint now);
  void send_untracked(Session& s, Packet packet, TimePoint now);
  void reject_peer(Session& s, ResponseCode code, TimePoint now);
  void release(const Endpoint& ep, const std::vector<TrackingId>& tids);
  void to_transport(TransportCmd cmd);
  void to_app(FilterNotice notice);
  void reply(FilterRsp rsp);

  // ---------- session teardown ----------
  /// Drop in-flight packets, tell the transport, erase. Silent.
  void remove_session(const Endpoint& ep);
  /// remove_session() plus exactly one EndpointFailed notice.
  void fail_endpoint(const Endpoint& ep, FailReason reason);

  std::string mint_cookie();

  std::shared_ptr<TransportCmdChannel>    transport_cmd_;
  std::shared_ptr<TransportRspChannel>    transport_rsp_;
  std::shared_ptr<TransportNoticeChannel> transport_notice_;
  std::shared_ptr<FilterCmdChannel>       cmd_;
  std::shared_ptr<FilterRspChannel>       rsp_;
  std::shared_ptr<FilterNoticeChannel>    notice_;
  std::shared_ptr<Signal>                 wake_;

  FilterMode             mode_;
  FilterConfig           config_;
  std::shared_ptr<Clock> clock_;

  std::unordered_map<Endpoint, Session> sessions_;

  bool                     shutting_down_{false};
  std::optional<TimePoint> drain_deadline_;
  std::atomic<bool>        stopped_{false};
  ShutdownCoordinator      shutdown_;

  std::mt19937_64 rng_;

  struct Counters {
    std::atomic<uint64_t> packets_sent{0};
    std::atomic<uint64_t> retransmissions{0};
    std::atomic<uint64_t> duplicates{0};
    std::atomic<uint64_t> out_of_order{0};
    std::atomic<uint64_t> packets_acked{0};
    std::atomic<uint64_t> malformed{0};
    std::atomic<uint64_t> peer_rejections{0};
    std::atomic<uint64_t> endpoints_failed{0};
  } counters_;
};

} // namespace netway

#endif // NETWAY_FILTER_HPP
