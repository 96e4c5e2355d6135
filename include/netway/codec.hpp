#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "netway/protocol.hpp"

namespace netway {
namespace codec {

/**
 * @brief Build the JSON object for a request action.
 * @details Shape: `{"type":"Connect","name":...,"client_version":...}`. Unit
 *          variants carry only `"type"`.
 */
nlohmann::json action_to_json(const RequestAction& action);

/**
 * @brief Build the JSON object for a response code.
 * @details Shape: `{"type":"LoggedIn","cookie":...,"server_version":...}`.
 */
nlohmann::json code_to_json(const ResponseCode& code);

/**
 * @brief Build the JSON object for a packet.
 * @details Shape:
 *   `{"type":"Request","sequence":N,"response_ack":N|null,"cookie":S|null,"action":{...}}`
 *   `{"type":"Response","sequence":N,"request_ack":N|null,"code":{...}}`
 */
nlohmann::json packet_to_json(const Packet& packet);

/**
 * @brief Read a request action back.
 * @throws nlohmann::json::exception on missing keys or wrong types.
 * @throws std::invalid_argument on an unknown `"type"`.
 */
RequestAction action_from_json(const nlohmann::json& j);

/// @copydoc action_from_json
ResponseCode code_from_json(const nlohmann::json& j);

/// @copydoc action_from_json
Packet packet_from_json(const nlohmann::json& j);

/**
 * @brief Serialize a packet to a compact JSON string.
 * @param packet  The packet to serialize.
 * @return A JSON-formatted std::string.
 */
std::string encode(const Packet& packet);

/**
 * @brief Parse a JSON string into a packet.
 * @param text   Input text.
 * @param error  Optional sink for a one-line reason when parsing fails.
 * @return The packet, or std::nullopt when the text is not a valid packet.
 *
 * @details Never throws; every parse or shape error turns into std::nullopt.
 */
std::optional<Packet> decode(const std::string& text, std::string* error = nullptr);

} // namespace codec
} // namespace netway
