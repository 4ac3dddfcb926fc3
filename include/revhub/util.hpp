#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace revhub {

// Validate a hex string of exactly `len` characters.
auto looks_hex(std::string_view str, std::size_t len) -> bool;

// First consts::kShortIdLen characters of an identifier.
auto abbrev(std::string_view id) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  auto to_lower(std::string_view str) -> std::string;

  // Split "a,b c" style lists on commas and whitespace; empty items dropped.
  auto split_list(std::string_view str) -> std::vector<std::string>;

  // Join with `sep`; `empty` when there is nothing to join.
  auto join(const std::vector<std::string>& items, std::string_view sep,
            std::string_view empty = "") -> std::string;
}

}
