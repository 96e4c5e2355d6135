/**
 * @file messages.hpp
 * @brief Typed commands, responses and notices that cross the Filter's boundaries.
 *
 * @details
 * ## Flow
 * ```
 *   [Application]                      [Filter]                       [Transport]
 *        │  FilterCmd  ───────────────►   │                                │
 *        │  ◄──────────── FilterRsp       │                                │
 *        │  ◄──────────── FilterNotice    │  TransportCmd ───────────────► │
 *        │                                │  ◄────────────── TransportRsp  │
 *        │                                │  ◄────────────── TransportNotice
 * ```
 * - **Commands** go down (the receiver must act).
 * - **Responses** come back up for commands that can fail synchronously.
 *   The Filter only sends a `FilterRsp` when something went wrong, so an
 *   application that never reads the response channel still works.
 * - **Notices** come up unsolicited (a packet arrived, a peer failed).
 *
 * Each message set is a closed `std::variant`; consumers `std::visit` it.
 * The `*Channel` aliases at the bottom fix the channel type per direction.
 */
#ifndef NETWAY_MESSAGES_HPP
#define NETWAY_MESSAGES_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "netway/channel.hpp"
#include "netway/common.hpp"
#include "netway/protocol.hpp"

namespace netway {

// ---------- application → filter ----------

namespace filter_cmd {

/// Client mode: send a request to the server at `endpoint`.
struct SendRequestAction {
  Endpoint      endpoint;
  RequestAction action;
};

/// Server mode: send a response to the client at `endpoint`.
struct SendResponseCode {
  Endpoint     endpoint;
  ResponseCode code;
};

/// Forget a peer now: drop its in-flight packets and its session.
struct DropEndpoint {
  Endpoint endpoint;
};

/**
 * Stop the engine. `graceful = true` finishes commands already queued and
 * waits (bounded by the drain timeout) for in-flight packets to be acked;
 * `graceful = false` stops at once.
 */
struct Shutdown {
  bool graceful{false};
};

} // namespace filter_cmd

using FilterCmd = std::variant<filter_cmd::SendRequestAction,
                               filter_cmd::SendResponseCode,
                               filter_cmd::DropEndpoint,
                               filter_cmd::Shutdown>;

// ---------- filter → application (responses) ----------

/// Why a command was refused.
enum class FilterError : uint8_t {
  WrongMode,      ///< e.g. SendRequestAction on a server-mode filter
  InvalidPhase,   ///< e.g. LoggedIn for a session that is not Connecting
  ShuttingDown,   ///< command arrived after a Shutdown
};

const char* to_string(FilterError e);

namespace filter_rsp {

struct NoSuchEndpoint {
  Endpoint endpoint;
};

struct Rejected {
  Endpoint    endpoint;
  FilterError error;
  std::string detail;
};

} // namespace filter_rsp

using FilterRsp = std::variant<filter_rsp::NoSuchEndpoint, filter_rsp::Rejected>;

// ---------- filter → application (notices) ----------

/// Why a session was torn down without the application asking.
enum class FailReason : uint8_t {
  RetryLimit,     ///< a packet was retransmitted max_retries times without ack
  IdleTimeout,    ///< nothing received for endpoint_idle_timeout_ms
};

const char* to_string(FailReason r);

namespace filter_notice {

/// A new (not duplicate) request from a peer. Server mode.
struct NewRequestAction {
  Endpoint      endpoint;
  RequestAction action;
};

/// A new (not duplicate) response from the server. Client mode.
struct NewResponseCode {
  Endpoint     endpoint;
  ResponseCode code;
};

/// Reported once per endpoint; the session is already gone.
struct EndpointFailed {
  Endpoint   endpoint;
  FailReason reason;
};

} // namespace filter_notice

using FilterNotice = std::variant<filter_notice::NewRequestAction,
                                  filter_notice::NewResponseCode,
                                  filter_notice::EndpointFailed>;

// ---------- filter ↔ transport ----------

/// Per-packet send metadata; one per packet in SendPackets, same order.
struct PacketInfo {
  TrackingId tid{0};
  uint32_t   retry_count{0};   ///< 0 for the first send
};

namespace transport_cmd {

struct SendPackets {
  Endpoint                endpoint;
  std::vector<Packet>     packets;
  std::vector<PacketInfo> packet_infos;
};

/// The packet sent under `tid` is acknowledged; release any copy of it.
struct DropPacket {
  Endpoint   endpoint;
  TrackingId tid{0};
};

/// The session is gone; release everything held for this peer.
struct DropEndpoint {
  Endpoint endpoint;
};

} // namespace transport_cmd

using TransportCmd = std::variant<transport_cmd::SendPackets,
                                  transport_cmd::DropPacket,
                                  transport_cmd::DropEndpoint>;

namespace transport_rsp {

struct Accepted {};

struct BufferFull {
  Endpoint endpoint;
};

struct EndpointNotFound {
  Endpoint endpoint;
};

} // namespace transport_rsp

using TransportRsp = std::variant<transport_rsp::Accepted,
                                  transport_rsp::BufferFull,
                                  transport_rsp::EndpointNotFound>;

namespace transport_notice {

struct PacketDelivery {
  Endpoint endpoint;
  Packet   packet;
};

/// A datagram from `endpoint` did not decode; the Filter logs and drops it.
struct MalformedPacket {
  Endpoint    endpoint;
  std::string detail;
};

} // namespace transport_notice

using TransportNotice = std::variant<transport_notice::PacketDelivery,
                                     transport_notice::MalformedPacket>;

// ---------- channel types ----------

using FilterCmdChannel       = Channel<FilterCmd>;
using FilterRspChannel       = Channel<FilterRsp>;
using FilterNoticeChannel    = Channel<FilterNotice>;
using TransportCmdChannel    = Channel<TransportCmd>;
using TransportRspChannel    = Channel<TransportRsp>;
using TransportNoticeChannel = Channel<TransportNotice>;

} // namespace netway

#endif // NETWAY_MESSAGES_HPP
