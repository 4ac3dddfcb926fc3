#include "cli/session.hpp"

#include "revhub/config.hpp"
#include "revhub/fs.hpp"
#include "revhub/store.hpp"

#include <charconv>
#include <iostream>

namespace revhub::cli {

bool is_repo(const std::filesystem::path &root) { return fs::exists(state_path(root)); }

std::unique_ptr<Repository> open_repo(const std::filesystem::path &root) {
  auto repo = load_repository(root);
  repo->set_actor(load_identity(root));
  return repo;
}

void save_repo(const std::filesystem::path &root, const Repository &repo) {
  save_repository(root, repo);
}

int report(std::string_view cmd, const Failure &failure) {
  std::cerr << cmd << ": " << error_code_name(failure.code) << ": " << failure.message << "\n";
  return 1;
}

int not_a_repo(std::string_view cmd) {
  std::cerr << cmd << ": not a revhub repo (run `revhub init <name>`)\n";
  return 1;
}

std::vector<std::string> args_from(int argc, char **argv, int from) {
  std::vector<std::string> out;
  for (int i = from; i < argc; ++i) out.emplace_back(argv[i]);
  return out;
}

bool parse_id(std::string_view text, std::uint64_t &out) {
  std::uint64_t v = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc{} || ptr != text.data() + text.size() || v == 0) return false;
  out = v;
  return true;
}

} // namespace revhub::cli
