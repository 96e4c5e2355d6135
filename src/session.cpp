// -----------------------------------------------------------------------------
// session.cpp: Implementation of per-endpoint Session state
//
// API & field descriptions:
//   see include/netway/session.hpp
//
// NOTE: This file focuses on how sequence, ack and in-flight bookkeeping is
// done. Handshake decisions live in the Filter, not here.
// -----------------------------------------------------------------------------
#include "netway/session.hpp"

#include <algorithm>
#include <utility>

namespace netway {

const char* to_string(SessionPhase p) {
  switch (p) {
    case SessionPhase::Unauthenticated: return "unauthenticated";
    case SessionPhase::Connecting:      return "connecting";
    case SessionPhase::Established:     return "established";
    case SessionPhase::Closing:         return "closing";
  }
  return "unknown";
}

const char* to_string(InboundClass c) {
  switch (c) {
    case InboundClass::New:        return "new";
    case InboundClass::Duplicate:  return "duplicate";
    case InboundClass::OutOfOrder: return "out_of_order";
  }
  return "unknown";
}

Session::Session(Endpoint endpoint, SessionRole role, SessionPhase phase, TimePoint now)
: endpoint_(std::move(endpoint)),
  role_(role),
  phase_(phase),
  last_recv_time_(now),
  last_send_time_(now) {}

// ---------- inbound ----------

InboundClass Session::classify(uint64_t seq) const {
  if (!highest_recv_seq_) return InboundClass::New;             // first packet ever
  if (seq <= *highest_recv_seq_) return InboundClass::Duplicate;
  if (seq == *highest_recv_seq_ + 1) return InboundClass::New;
  return InboundClass::OutOfOrder;                              // gap left behind on purpose
}

// -----------------------------------------------------------------------------
// observe_inbound(): classify, move the high-water mark, apply the ack.
// POLICY:
//   - OutOfOrder jumps the high-water mark; the gap is never filled later.
//   - Duplicates keep the mark but still apply their ack.
// OUT:
//   - released: tracking ids the caller must turn into DropPacket commands.
// -----------------------------------------------------------------------------
InboundResult Session::observe_inbound(uint64_t seq, std::optional<uint64_t> ack, TimePoint now) {
  InboundResult result;
  result.cls = classify(seq);
  if (result.cls != InboundClass::Duplicate) {
    highest_recv_seq_ = seq;
  }
  last_recv_time_ = now;
  if (ack) {
    result.released = acknowledge(*ack);
  }
  return result;
}

// ---------- outbound ----------

void Session::refresh_ack(Packet& packet) const {
  if (auto* req = std::get_if<Request>(&packet)) {
    req->response_ack = highest_recv_seq_;
    if (!cookie_.empty()) req->cookie = cookie_;
  } else {
    std::get<Response>(packet).request_ack = highest_recv_seq_;
  }
}

void Session::stamp(Packet& packet, TimePoint now) {
  const uint64_t seq = next_send_seq_++;                          // sequences never repeat
  std::visit([seq](auto& p) { p.sequence = seq; }, packet);
  refresh_ack(packet);
  last_send_time_ = now;
}

TrackingId Session::register_outbound(Packet packet, TimePoint now) {
  stamp(packet, now);
  const TrackingId tid = next_tracking_id();
  InflightEntry entry;
  entry.sequence    = packet_sequence(packet);
  entry.send_time   = now;
  entry.retry_count = 0;
  entry.packet      = std::move(packet);
  inflight_.emplace(tid, std::move(entry));
  return tid;
}

Packet Session::stamp_unreliable(Packet packet, TimePoint now) {
  stamp(packet, now);
  return packet;
}

// -----------------------------------------------------------------------------
// acknowledge(): release everything the peer has confirmed.
// POLICY:
//   - Cumulative: ack N covers every sequence <= N.
//   - peer_ack_seq only moves forward; an older ack releases nothing new.
// -----------------------------------------------------------------------------
std::vector<TrackingId> Session::acknowledge(uint64_t ack_seq) {
  std::vector<TrackingId> released;
  if (ack_seq > peer_ack_seq_) peer_ack_seq_ = ack_seq;

  for (auto it = inflight_.begin(); it != inflight_.end();) {
    if (it->second.sequence <= ack_seq) {
      released.push_back(it->first);
      it = inflight_.erase(it);
    } else {
      ++it;
    }
  }
  return released;
}

std::vector<TrackingId> Session::due_for_retry(TimePoint now, Milliseconds retry_interval) const {
  std::vector<std::pair<uint64_t, TrackingId>> due;               // (sequence, tid) for ordering
  for (const auto& [tid, entry] : inflight_) {
    if (now - entry.send_time >= retry_interval) {
      due.emplace_back(entry.sequence, tid);
    }
  }
  std::sort(due.begin(), due.end());

  std::vector<TrackingId> out;
  out.reserve(due.size());
  for (const auto& d : due) out.push_back(d.second);
  return out;
}

std::optional<TrackingId> Session::retransmit(TrackingId old_tid, TimePoint now) {
  auto it = inflight_.find(old_tid);
  if (it == inflight_.end()) return std::nullopt;

  InflightEntry entry = std::move(it->second);
  inflight_.erase(it);

  entry.send_time = now;
  entry.retry_count += 1;
  refresh_ack(entry.packet);                                      // sequence stays, ack catches up

  const TrackingId tid = next_tracking_id();
  inflight_.emplace(tid, std::move(entry));
  last_send_time_ = now;
  return tid;
}

bool Session::exhausted(TimePoint now, Milliseconds retry_interval, uint32_t max_retries) const {
  for (const auto& kv : inflight_) {
    const InflightEntry& e = kv.second;
    if (e.retry_count >= max_retries && now - e.send_time >= retry_interval) return true;
  }
  return false;
}

std::vector<TrackingId> Session::clear_inflight() {
  std::vector<TrackingId> ids;
  ids.reserve(inflight_.size());
  for (const auto& kv : inflight_) ids.push_back(kv.first);
  inflight_.clear();
  return ids;
}

const InflightEntry* Session::find_inflight(TrackingId tid) const {
  auto it = inflight_.find(tid);
  return it == inflight_.end() ? nullptr : &it->second;
}

} // namespace netway
