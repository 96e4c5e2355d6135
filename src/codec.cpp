// -----------------------------------------------------------------------------
// codec.cpp: JSON rendition of the netway packet contract.
//
// API & field descriptions:
//   see include/netway/codec.hpp
//
// USED BY:
//   - debug rendering (to_string() in protocol.cpp)
//   - the simulated link in cli/lossy_link.cpp, which moves packets as text
//   - tests that feed hand-written packets
//
// POLICY:
//   - Decoding is strict: every field must be present with the right JSON
//     type and "type" must name a known variant.
//   - decode() never throws; the *_from_json() helpers do, for callers that
//     already hold a parsed document.
// -----------------------------------------------------------------------------
#include "netway/codec.hpp"

#include <stdexcept>
#include <type_traits>

using nlohmann::json;

namespace netway {
namespace codec {

namespace {

template <class>
inline constexpr bool always_false = false;

json opt_to_json(const std::optional<uint64_t>& v) {
  return v ? json(*v) : json(nullptr);
}

std::optional<uint64_t> opt_u64(const json& j, const char* key) {
  const json& v = j.at(key);
  if (v.is_null()) return std::nullopt;
  return v.get<uint64_t>();
}

} // namespace

json action_to_json(const RequestAction& action) {
  json j = json::object();
  j["type"] = action_name(action);
  std::visit([&j](const auto& a) {
    using T = std::decay_t<decltype(a)>;
    if constexpr (std::is_same_v<T, action::Connect>) {
      j["name"]           = a.name;
      j["client_version"] = a.client_version;
    } else if constexpr (std::is_same_v<T, action::KeepAlive>) {
      j["latest_response_ack"] = a.latest_response_ack;
    } else if constexpr (std::is_same_v<T, action::ChatMessage>) {
      j["message"] = a.message;
    } else if constexpr (std::is_same_v<T, action::NewRoom> ||
                         std::is_same_v<T, action::JoinRoom>) {
      j["room_name"] = a.room_name;
    } else if constexpr (std::is_same_v<T, action::Disconnect> ||
                         std::is_same_v<T, action::ListPlayers> ||
                         std::is_same_v<T, action::ListRooms> ||
                         std::is_same_v<T, action::LeaveRoom>) {
      // unit variant: tag only
    } else {
      static_assert(always_false<T>, "unhandled RequestAction alternative");
    }
  }, action);
  return j;
}

json code_to_json(const ResponseCode& code) {
  json j = json::object();
  j["type"] = code_name(code);
  std::visit([&j](const auto& c) {
    using T = std::decay_t<decltype(c)>;
    if constexpr (std::is_same_v<T, code::LoggedIn>) {
      j["cookie"]         = c.cookie;
      j["server_version"] = c.server_version;
    } else if constexpr (std::is_same_v<T, code::JoinedRoom>) {
      j["room_name"] = c.room_name;
    } else if constexpr (std::is_same_v<T, code::PlayerList>) {
      j["players"] = c.players;
    } else if constexpr (std::is_same_v<T, code::RoomList>) {
      j["rooms"] = c.rooms;
    } else if constexpr (std::is_same_v<T, code::BadRequest> ||
                         std::is_same_v<T, code::Unauthorized>) {
      j["error_msg"] = c.error_msg;
    } else if constexpr (std::is_same_v<T, code::IncompatibleVersion>) {
      j["server_version"] = c.server_version;
    } else if constexpr (std::is_same_v<T, code::OK> ||
                         std::is_same_v<T, code::LeftRoom>) {
      // unit variant: tag only
    } else {
      static_assert(always_false<T>, "unhandled ResponseCode alternative");
    }
  }, code);
  return j;
}

json packet_to_json(const Packet& packet) {
  json j = json::object();
  if (const auto* req = std::get_if<Request>(&packet)) {
    j["type"]         = "Request";
    j["sequence"]     = req->sequence;
    j["response_ack"] = opt_to_json(req->response_ack);
    j["cookie"]       = req->cookie ? json(*req->cookie) : json(nullptr);
    j["action"]       = action_to_json(req->action);
  } else {
    const auto& rsp = std::get<Response>(packet);
    j["type"]        = "Response";
    j["sequence"]    = rsp.sequence;
    j["request_ack"] = opt_to_json(rsp.request_ack);
    j["code"]        = code_to_json(rsp.code);
  }
  return j;
}

RequestAction action_from_json(const json& j) {
  const std::string type = j.at("type").get<std::string>();
  if (type == "Connect") {
    return action::Connect{j.at("name").get<std::string>(),
                           j.at("client_version").get<std::string>()};
  }
  if (type == "Disconnect")  return action::Disconnect{};
  if (type == "KeepAlive")   return action::KeepAlive{j.at("latest_response_ack").get<uint64_t>()};
  if (type == "ListPlayers") return action::ListPlayers{};
  if (type == "ChatMessage") return action::ChatMessage{j.at("message").get<std::string>()};
  if (type == "ListRooms")   return action::ListRooms{};
  if (type == "NewRoom")     return action::NewRoom{j.at("room_name").get<std::string>()};
  if (type == "JoinRoom")    return action::JoinRoom{j.at("room_name").get<std::string>()};
  if (type == "LeaveRoom")   return action::LeaveRoom{};
  throw std::invalid_argument("unknown request action: " + type);
}

ResponseCode code_from_json(const json& j) {
  const std::string type = j.at("type").get<std::string>();
  if (type == "OK") return code::OK{};
  if (type == "LoggedIn") {
    return code::LoggedIn{j.at("cookie").get<std::string>(),
                          j.at("server_version").get<std::string>()};
  }
  if (type == "JoinedRoom")   return code::JoinedRoom{j.at("room_name").get<std::string>()};
  if (type == "LeftRoom")     return code::LeftRoom{};
  if (type == "PlayerList")   return code::PlayerList{j.at("players").get<std::vector<std::string>>()};
  if (type == "RoomList")     return code::RoomList{j.at("rooms").get<std::vector<std::string>>()};
  if (type == "BadRequest")   return code::BadRequest{j.at("error_msg").get<std::string>()};
  if (type == "Unauthorized") return code::Unauthorized{j.at("error_msg").get<std::string>()};
  if (type == "IncompatibleVersion") {
    return code::IncompatibleVersion{j.at("server_version").get<std::string>()};
  }
  throw std::invalid_argument("unknown response code: " + type);
}

Packet packet_from_json(const json& j) {
  const std::string type = j.at("type").get<std::string>();
  if (type == "Request") {
    Request req;
    req.sequence     = j.at("sequence").get<uint64_t>();
    req.response_ack = opt_u64(j, "response_ack");
    const json& cookie = j.at("cookie");
    if (!cookie.is_null()) req.cookie = cookie.get<std::string>();
    req.action = action_from_json(j.at("action"));
    return req;
  }
  if (type == "Response") {
    Response rsp;
    rsp.sequence    = j.at("sequence").get<uint64_t>();
    rsp.request_ack = opt_u64(j, "request_ack");
    rsp.code        = code_from_json(j.at("code"));
    return rsp;
  }
  throw std::invalid_argument("unknown packet type: " + type);
}

std::string encode(const Packet& packet) {
  return packet_to_json(packet).dump();
}

/**
 * @details
 *   json::parse() and the typed accessors throw json::exception subclasses
 *   (parse_error, type_error, out_of_range); unknown tags throw
 *   std::invalid_argument. Both are turned into std::nullopt here so the
 *   transport boundary can report a malformed datagram instead of unwinding.
 */
std::optional<Packet> decode(const std::string& text, std::string* error) {
  try {
    return packet_from_json(json::parse(text));
  } catch (const json::exception& e) {
    if (error) *error = e.what();
  } catch (const std::invalid_argument& e) {
    if (error) *error = e.what();
  }
  return std::nullopt;
}

} // namespace codec
} // namespace netway
