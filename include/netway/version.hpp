/**
 * @file version.hpp
 * @brief Dotted version numbers and the client compatibility check.
 *
 * @details
 * The server decides during the handshake whether a `Connect{client_version}`
 * may proceed. The rule is deliberately small:
 *  - the client version must parse as `MAJOR[.MINOR[.PATCH[...]]]`
 *    (missing parts count as 0, parts past PATCH are ignored),
 *  - its MAJOR must equal the MAJOR of the configured minimum,
 *  - and it must not be lower than the minimum.
 *
 * Anything else is answered with `IncompatibleVersion`.
 */
#ifndef NETWAY_VERSION_HPP
#define NETWAY_VERSION_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace netway {

struct Version {
  uint32_t major{0};
  uint32_t minor{0};
  uint32_t patch{0};

  /**
   * @brief Parse "1", "1.2", "1.2.3" or "1.2.3.4.5".
   * @return std::nullopt for empty strings, non-digits, empty parts or
   *         parts that overflow 32 bits.
   */
  static std::optional<Version> parse(const std::string& text);

  std::string to_string() const;

  bool operator==(const Version& o) const {
    return major == o.major && minor == o.minor && patch == o.patch;
  }
  bool operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    return patch < o.patch;
  }
};

/**
 * @brief Server-side handshake policy.
 * @param client_version  Version string sent by the client.
 * @param min_version     Lowest accepted client version (config).
 * @return true when the client may log in.
 */
bool is_client_compatible(const std::string& client_version, const std::string& min_version);

} // namespace netway

#endif // NETWAY_VERSION_HPP
