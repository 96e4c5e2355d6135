/**
 * @file protocol.hpp
 * @brief Wire-level value types: Packet, RequestAction, ResponseCode.
 *
 * @details
 * These types are the data contract between the Filter and the codec. They
 * carry no behavior beyond equality and debug formatting; the Filter stamps
 * sequences and acks into them, the codec (see codec.hpp) moves them on and
 * off the wire.
 *
 * ### Shape
 * @code
 *   Packet = Request  { sequence, response_ack?, cookie?, action }
 *          | Response { sequence, request_ack?,  code }
 * @endcode
 *
 * - `sequence` is the sender's own counter for its role (requests for a
 *   client, responses for a server). New packets advance it by exactly one;
 *   retransmissions reuse it.
 * - `response_ack` / `request_ack` is the highest sequence of the opposite
 *   direction the sender has fully processed.
 * - `cookie` is required on every request after the handshake.
 *
 * ### Closed variants
 * `RequestAction` and `ResponseCode` are `std::variant`s over small structs.
 * Dispatch with `std::visit` or `std::get_if`; adding an alternative is a
 * compile error everywhere a visitor is not updated, which is the point.
 */
#ifndef NETWAY_PROTOCOL_HPP
#define NETWAY_PROTOCOL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace netway {

// ---------- request actions ----------

namespace action {

/// First request of a session. Answered with LoggedIn or IncompatibleVersion.
struct Connect {
  std::string name;
  std::string client_version;
  bool operator==(const Connect& o) const {
    return name == o.name && client_version == o.client_version;
  }
};

/// Peer is leaving; the session closes without waiting for acks.
struct Disconnect {
  bool operator==(const Disconnect&) const { return true; }
};

/**
 * Carries no work for the application. Only advances the peer's ack so the
 * server can release its retransmission set.
 */
struct KeepAlive {
  uint64_t latest_response_ack{0};
  bool operator==(const KeepAlive& o) const { return latest_response_ack == o.latest_response_ack; }
};

struct ListPlayers {
  bool operator==(const ListPlayers&) const { return true; }
};

struct ChatMessage {
  std::string message;
  bool operator==(const ChatMessage& o) const { return message == o.message; }
};

struct ListRooms {
  bool operator==(const ListRooms&) const { return true; }
};

struct NewRoom {
  std::string room_name;
  bool operator==(const NewRoom& o) const { return room_name == o.room_name; }
};

struct JoinRoom {
  std::string room_name;
  bool operator==(const JoinRoom& o) const { return room_name == o.room_name; }
};

struct LeaveRoom {
  bool operator==(const LeaveRoom&) const { return true; }
};

} // namespace action

using RequestAction = std::variant<action::Connect,
                                   action::Disconnect,
                                   action::KeepAlive,
                                   action::ListPlayers,
                                   action::ChatMessage,
                                   action::ListRooms,
                                   action::NewRoom,
                                   action::JoinRoom,
                                   action::LeaveRoom>;

// ---------- response codes ----------

namespace code {

struct OK {
  bool operator==(const OK&) const { return true; }
};

/// Completes the handshake. `cookie` must accompany every later request.
struct LoggedIn {
  std::string cookie;
  std::string server_version;
  bool operator==(const LoggedIn& o) const {
    return cookie == o.cookie && server_version == o.server_version;
  }
};

struct JoinedRoom {
  std::string room_name;
  bool operator==(const JoinedRoom& o) const { return room_name == o.room_name; }
};

struct LeftRoom {
  bool operator==(const LeftRoom&) const { return true; }
};

struct PlayerList {
  std::vector<std::string> players;
  bool operator==(const PlayerList& o) const { return players == o.players; }
};

struct RoomList {
  std::vector<std::string> rooms;
  bool operator==(const RoomList& o) const { return rooms == o.rooms; }
};

struct BadRequest {
  std::string error_msg;
  bool operator==(const BadRequest& o) const { return error_msg == o.error_msg; }
};

/// Missing/wrong cookie, or a request other than Connect before the handshake.
struct Unauthorized {
  std::string error_msg;
  bool operator==(const Unauthorized& o) const { return error_msg == o.error_msg; }
};

/// Client version rejected by the server's compatibility policy.
struct IncompatibleVersion {
  std::string server_version;
  bool operator==(const IncompatibleVersion& o) const { return server_version == o.server_version; }
};

} // namespace code

using ResponseCode = std::variant<code::OK,
                                  code::LoggedIn,
                                  code::JoinedRoom,
                                  code::LeftRoom,
                                  code::PlayerList,
                                  code::RoomList,
                                  code::BadRequest,
                                  code::Unauthorized,
                                  code::IncompatibleVersion>;

// ---------- packets ----------

struct Request {
  uint64_t                    sequence{0};
  std::optional<uint64_t>     response_ack;
  std::optional<std::string>  cookie;
  RequestAction               action;

  bool operator==(const Request& o) const {
    return sequence == o.sequence && response_ack == o.response_ack &&
           cookie == o.cookie && action == o.action;
  }
  bool operator!=(const Request& o) const { return !(*this == o); }
};

struct Response {
  uint64_t                sequence{0};
  std::optional<uint64_t> request_ack;
  ResponseCode            code;

  bool operator==(const Response& o) const {
    return sequence == o.sequence && request_ack == o.request_ack && code == o.code;
  }
  bool operator!=(const Response& o) const { return !(*this == o); }
};

using Packet = std::variant<Request, Response>;

// ---------- helpers ----------

/// Variant tag name, e.g. "Connect", "KeepAlive".
const char* action_name(const RequestAction& action);

/// Variant tag name, e.g. "LoggedIn", "Unauthorized".
const char* code_name(const ResponseCode& code);

/// Sequence of either packet variant.
uint64_t packet_sequence(const Packet& packet);

/// Debug rendering (compact JSON). Not a stable wire format.
std::string to_string(const RequestAction& action);
std::string to_string(const ResponseCode& code);
std::string to_string(const Packet& packet);

} // namespace netway

#endif // NETWAY_PROTOCOL_HPP
