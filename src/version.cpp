// -----------------------------------------------------------------------------
// version.cpp: dotted version parsing and the handshake compatibility rule.
//
// API & field descriptions:
//   see include/netway/version.hpp
// -----------------------------------------------------------------------------
#include "netway/version.hpp"

#include <limits>

namespace netway {

// -----------------------------------------------------------------------------
// Version::parse(): split on '.', read up to three decimal parts.
// POLICY:
//   - Every part, including ignored trailing ones, must be 1+ digits.
//   - No signs, spaces or suffixes ("1.2.3-beta" is rejected).
// -----------------------------------------------------------------------------
std::optional<Version> Version::parse(const std::string& text) {
  if (text.empty()) return std::nullopt;

  uint32_t parts[3] = {0, 0, 0};
  size_t   index    = 0;        // which part we are filling
  uint64_t value    = 0;        // accumulator for the current part
  bool     digits   = false;    // saw at least one digit in the current part

  for (size_t i = 0; i <= text.size(); ++i) {
    const char c = (i < text.size()) ? text[i] : '.';  // virtual terminator closes the last part
    if (c >= '0' && c <= '9') {
      value = value * 10 + static_cast<uint64_t>(c - '0');
      if (value > std::numeric_limits<uint32_t>::max()) return std::nullopt;
      digits = true;
    } else if (c == '.') {
      if (!digits) return std::nullopt;               // "", "1..2", ".1"
      if (index < 3) parts[index] = static_cast<uint32_t>(value);
      ++index;
      value  = 0;
      digits = false;
    } else {
      return std::nullopt;
    }
  }

  return Version{parts[0], parts[1], parts[2]};
}

std::string Version::to_string() const {
  return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

bool is_client_compatible(const std::string& client_version, const std::string& min_version) {
  const auto client  = Version::parse(client_version);
  const auto minimum = Version::parse(min_version);
  if (!client || !minimum) return false;
  if (client->major != minimum->major) return false;
  return !(*client < *minimum);
}

} // namespace netway
