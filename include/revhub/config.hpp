#pragma once
#include <filesystem>
#include <string>

namespace revhub {

// Acting user. Roles are keyed by email; commits record the email as author.
struct Identity {
  std::string name;
  std::string email;
};

// Path of .revhub/config under the given working root.
std::filesystem::path config_path(const std::filesystem::path& root);

// Read identity from .revhub/config (empty fields if missing)
Identity load_identity(const std::filesystem::path& root);

// Overwrite .revhub/config with the given identity
void save_identity(const std::filesystem::path& root, const Identity& id);

} // namespace revhub
