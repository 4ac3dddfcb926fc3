#include "revhub/config.hpp"

#include "revhub/consts.hpp"
#include "revhub/fs.hpp"

#include <sstream>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace

namespace revhub {

std::filesystem::path config_path(const std::filesystem::path &root) {
  return root / consts::kStateDir / consts::kConfigFile;
}

auto load_identity(const std::filesystem::path &root) -> Identity {
  Identity out{};
  const auto path = config_path(root);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  constexpr std::string_view k_author = "author:";
  constexpr std::string_view k_email = "email:";

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_author)) {
      out.name = trim(sv.substr(k_author.size()));
    } else if (sv.starts_with(k_email)) {
      out.email = trim(sv.substr(k_email.size()));
    }
  }
  return out;
}

void save_identity(const std::filesystem::path &root, const Identity &id) {
  std::ostringstream os;
  os << "author: " << id.name << '\n' << "email: " << id.email << '\n';

  const std::string s = os.str();
  const auto *data = reinterpret_cast<const std::uint8_t *>(s.data());
  fs::write_file_atomic(config_path(root), std::span(data, s.size()));
}

} // namespace revhub
