#pragma once

#include <array>
#include <cstdint>
#include <ctime>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace revhub {

// Raw 20-byte SHA-1 digest (binary, not hex)
using digest = std::array<std::uint8_t, 20>;

/**
 * Compute SHA-1 of arbitrary bytes.
 * The digest is an identifier only; nothing here is meant as a signature.
 */
digest sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert binary digest to 40-char lowercase hex. */
std::string to_hex(const digest &id);

/**
 * Build the canonical text hashed into a commit identifier:
 *   parent <id or empty>\n
 *   author <byte length> <author>\n
 *   time <epoch seconds>\n
 *   file <byte length> <path>\n   (one line per path, in order)
 *   \n<message>
 */
auto commit_payload(const std::optional<std::string> &parent, std::string_view author,
                    std::time_t timestamp, std::string_view message,
                    const std::vector<std::string> &paths) -> std::string;

// Deterministic commit identifier: the first consts::kCommitIdLen hex digits
// of sha1(commit_payload(...)).
auto commit_id(const std::optional<std::string> &parent, std::string_view author,
               std::time_t timestamp, std::string_view message,
               const std::vector<std::string> &paths) -> std::string;

} // namespace revhub
