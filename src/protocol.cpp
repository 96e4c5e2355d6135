// -----------------------------------------------------------------------------
// protocol.cpp: tag names and debug rendering for the packet value types.
//
// API & field descriptions:
//   see include/netway/protocol.hpp
// -----------------------------------------------------------------------------
#include "netway/protocol.hpp"
#include "netway/codec.hpp"

namespace netway {

namespace {

// Tag tables indexed by variant::index(); order must follow the alias lists.
constexpr const char* kActionNames[] = {
  "Connect", "Disconnect", "KeepAlive", "ListPlayers", "ChatMessage",
  "ListRooms", "NewRoom", "JoinRoom", "LeaveRoom",
};

constexpr const char* kCodeNames[] = {
  "OK", "LoggedIn", "JoinedRoom", "LeftRoom", "PlayerList",
  "RoomList", "BadRequest", "Unauthorized", "IncompatibleVersion",
};

static_assert(sizeof(kActionNames) / sizeof(kActionNames[0]) == std::variant_size_v<RequestAction>,
              "action name table out of sync with RequestAction");
static_assert(sizeof(kCodeNames) / sizeof(kCodeNames[0]) == std::variant_size_v<ResponseCode>,
              "code name table out of sync with ResponseCode");

} // namespace

const char* action_name(const RequestAction& action) {
  return kActionNames[action.index()];
}

const char* code_name(const ResponseCode& code) {
  return kCodeNames[code.index()];
}

uint64_t packet_sequence(const Packet& packet) {
  return std::visit([](const auto& p) { return p.sequence; }, packet);
}

std::string to_string(const RequestAction& action) {
  return codec::action_to_json(action).dump();
}

std::string to_string(const ResponseCode& code) {
  return codec::code_to_json(code).dump();
}

std::string to_string(const Packet& packet) {
  return codec::encode(packet);
}

} // namespace netway
