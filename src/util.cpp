// String and identifier helpers shared by the core and the CLI
#include "revhub/util.hpp"

#include "revhub/consts.hpp"

#include <algorithm>
#include <cctype>

namespace revhub {

bool looks_hex(std::string_view str, std::size_t len) {
  if (str.size() != len) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string abbrev(std::string_view id) {
  return std::string(id.substr(0, std::min(id.size(), consts::kShortIdLen)));
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string to_lower(std::string_view str) {
  std::string out(str);
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::vector<std::string> split_list(std::string_view str) {
  std::vector<std::string> out;
  std::string cur;
  for (const char c : str) {
    if (c == ',' || std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!cur.empty()) {
        out.push_back(std::move(cur));
        cur.clear();
      }
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

std::string join(const std::vector<std::string> &items, std::string_view sep,
                 std::string_view empty) {
  if (items.empty()) {
    return std::string(empty);
  }
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i != 0U) {
      out += sep;
    }
    out += items[i];
  }
  return out;
}

} // namespace strutil

} // namespace revhub
