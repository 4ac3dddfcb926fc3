#pragma once
#include "revhub/error.hpp"
#include "revhub/repo.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace revhub::cli {

// Does `root` hold a revhub state file?
bool is_repo(const std::filesystem::path &root);

// Load the repository under `root` and act as the configured identity.
std::unique_ptr<Repository> open_repo(const std::filesystem::path &root);

// Persist after a successful mutation.
void save_repo(const std::filesystem::path &root, const Repository &repo);

// Print "<cmd>: <ErrorName>: <message>" to stderr; returns 1.
int report(std::string_view cmd, const Failure &failure);

// Print the standard "not a revhub repo" hint; returns 1.
int not_a_repo(std::string_view cmd);

// argv[from..argc) as strings.
std::vector<std::string> args_from(int argc, char **argv, int from);

// Load the repository under the current directory and run
// `body(root, repo)`; unexpected exceptions are printed as "<cmd>: what".
template <typename Body> int with_repo(std::string_view cmd, Body &&body) {
  const auto root = std::filesystem::current_path();
  if (!is_repo(root)) {
    return not_a_repo(cmd);
  }
  try {
    auto repo = open_repo(root);
    return body(root, *repo);
  } catch (const std::exception &e) {
    std::cerr << cmd << ": " << e.what() << "\n";
    return 1;
  }
}

// Parse a pull request id; returns false on anything but a positive integer.
bool parse_id(std::string_view text, std::uint64_t &out);

} // namespace revhub::cli
