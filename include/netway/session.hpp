/**
 * @file session.hpp
 * @brief Per-endpoint reliability and authentication state owned by the Filter.
 *
 * @details
 * A `Session` remembers just enough about one peer to answer three questions:
 *   1. Is this inbound packet new, a duplicate, or ahead of a gap?
 *   2. Which of our sent packets are still waiting for the peer's ack?
 *   3. Where is the handshake?
 *
 * ### Sequence bookkeeping
 * - `next_send_seq`: sequence the next new packet gets (starts at 1).
 * - `highest_recv_seq`: highest inbound sequence accepted so far; it is
 *   piggy-backed as our ack on every packet we stamp.
 * - `peer_ack_seq`: highest of our sequences the peer acknowledged.
 *
 * ### Out-of-order policy
 * A packet that skips ahead (`seq > highest_recv_seq + 1`) is classified
 * `OutOfOrder`, delivered at once, and `highest_recv_seq` jumps to it. The
 * gap is never reconciled: a late packet from inside it is then `<=` the
 * high-water mark and is dropped as a `Duplicate`. Nothing is buffered.
 *
 * ### In-flight set
 * Every tracked packet lives in `inflight` under the tracking id of its
 * latest send attempt. `acknowledge()` removes everything at or below the
 * ack; `retransmit()` re-keys an entry under a fresh tracking id and bumps
 * its retry count. The Filter decides when a retry count is too high.
 *
 * A Session is a plain value owned by the Filter's session table. It is not
 * thread-safe and never needs to be: only the engine touches it.
 */
#ifndef NETWAY_SESSION_HPP
#define NETWAY_SESSION_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "netway/clock.hpp"
#include "netway/common.hpp"
#include "netway/protocol.hpp"

namespace netway {

enum class SessionPhase : uint8_t {
  Unauthenticated,  ///< server side, before a valid Connect
  Connecting,       ///< Connect accepted/sent, LoggedIn not yet exchanged
  Established,      ///< cookie agreed
  Closing,          ///< draining; removed once in-flight is empty
};

const char* to_string(SessionPhase p);

/// Which packet variant this side sends. Clients send requests.
enum class SessionRole : uint8_t {
  Requester,
  Responder,
};

enum class InboundClass : uint8_t {
  New,
  Duplicate,
  OutOfOrder,
};

const char* to_string(InboundClass c);

struct InflightEntry {
  uint64_t  sequence{0};
  TimePoint send_time{};     ///< time of the latest attempt
  uint32_t  retry_count{0};  ///< retransmissions so far
  Packet    packet;          ///< exactly what was handed to the transport
};

struct InboundResult {
  InboundClass            cls{InboundClass::New};
  std::vector<TrackingId> released;  ///< tracking ids acked by this packet
};

class Session {
public:
  Session(Endpoint endpoint, SessionRole role, SessionPhase phase, TimePoint now);

  /// Classify without recording. Use before deciding whether to accept.
  InboundClass classify(uint64_t seq) const;

  /**
   * @brief Record an inbound packet and apply its piggy-backed ack.
   * @param seq  Inbound sequence.
   * @param ack  Inbound ack of our sequences, if the packet carried one.
   * @return Classification, plus tracking ids released by the ack.
   *
   * Duplicates still apply their ack (acks only move forward) but do not
   * move `highest_recv_seq`.
   */
  InboundResult observe_inbound(uint64_t seq, std::optional<uint64_t> ack, TimePoint now);

  /**
   * @brief Stamp `packet` with the next sequence and our ack, then track it.
   * @details Requests also get the session cookie when one is set. The
   *          packet's variant must match the session role.
   * @return Tracking id of this first send attempt.
   */
  TrackingId register_outbound(Packet packet, TimePoint now);

  /// Stamp like register_outbound() but do not track (consumes a sequence).
  Packet stamp_unreliable(Packet packet, TimePoint now);

  /// Drop every in-flight entry with sequence <= ack_seq; return their ids.
  std::vector<TrackingId> acknowledge(uint64_t ack_seq);

  /// Tracking ids whose latest attempt is at least `retry_interval` old, by sequence.
  std::vector<TrackingId> due_for_retry(TimePoint now, Milliseconds retry_interval) const;

  /**
   * @brief Move the entry under `old_tid` to a fresh tracking id.
   * @details Sequence unchanged, ack refreshed, retry_count + 1, send_time = now.
   * @return New tracking id, or std::nullopt if `old_tid` is not in flight.
   */
  std::optional<TrackingId> retransmit(TrackingId old_tid, TimePoint now);

  /// True when some entry is due again after its last permitted retry.
  bool exhausted(TimePoint now, Milliseconds retry_interval, uint32_t max_retries) const;

  /// Forget every in-flight entry; return their ids.
  std::vector<TrackingId> clear_inflight();

  // ---------- accessors ----------

  const Endpoint& endpoint() const { return endpoint_; }
  SessionRole role() const { return role_; }

  SessionPhase phase() const { return phase_; }
  void set_phase(SessionPhase p) { phase_ = p; }

  const std::string& cookie() const { return cookie_; }
  void set_cookie(std::string c) { cookie_ = std::move(c); }

  /// Cookie minted when Connect was accepted, used if LoggedIn carries none.
  const std::string& pending_cookie() const { return pending_cookie_; }
  void set_pending_cookie(std::string c) { pending_cookie_ = std::move(c); }

  uint64_t next_send_seq() const { return next_send_seq_; }
  std::optional<uint64_t> highest_recv_seq() const { return highest_recv_seq_; }
  uint64_t peer_ack_seq() const { return peer_ack_seq_; }

  const std::map<TrackingId, InflightEntry>& inflight() const { return inflight_; }
  const InflightEntry* find_inflight(TrackingId tid) const;

  TimePoint last_recv_time() const { return last_recv_time_; }
  TimePoint last_send_time() const { return last_send_time_; }

private:
  /// Write sequence/ack/cookie into `packet`, advance counters.
  void stamp(Packet& packet, TimePoint now);
  void refresh_ack(Packet& packet) const;

  Endpoint     endpoint_;
  SessionRole  role_;
  SessionPhase phase_;

  uint64_t                next_send_seq_{1};
  std::optional<uint64_t> highest_recv_seq_;
  uint64_t                peer_ack_seq_{0};

  std::string cookie_;
  std::string pending_cookie_;

  std::map<TrackingId, InflightEntry> inflight_;

  TimePoint last_recv_time_;
  TimePoint last_send_time_;
};

} // namespace netway

#endif // NETWAY_SESSION_HPP
