#include "cli/session.hpp"

#include "revhub/repo.hpp"
#include "revhub/util.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace {

int list_branches(const revhub::Repository &repo) {
  const auto r = repo.list_branches();
  if (!r) {
    return revhub::cli::report("branch", r.error());
  }
  const auto &listing = r.value();
  for (const auto &b : listing.branches) {
    std::cout << (b.name == listing.head ? "* " : "  ") << b.name << "  "
              << (b.tip ? revhub::abbrev(*b.tip) : std::string("(no commits)")) << "\n";
  }
  std::cout << "\n";
  for (const auto &[name, depth] : listing.tree) {
    std::cout << std::string(depth * 2, ' ') << (depth == 0 ? "" : "└─ ") << name << "\n";
  }
  return 0;
}

} // namespace

int cmd_branch(int argc, char **argv) {
  const auto root = std::filesystem::current_path();
  if (!revhub::cli::is_repo(root)) {
    return revhub::cli::not_a_repo("branch");
  }
  try {
    auto repo = revhub::cli::open_repo(root);
    const std::string flag = argc >= 2 ? argv[1] : "--list";

    if (flag == "--list" || flag == "-l") {
      return list_branches(*repo);
    }

    if (flag == "-d") {
      if (argc < 3) {
        std::cerr << "usage: revhub branch -d <name>\n";
        return 2;
      }
      if (const auto r = repo->delete_branch(argv[2]); !r) {
        return revhub::cli::report("branch", r.error());
      }
      revhub::cli::save_repo(root, *repo);
      std::cout << "Deleted branch '" << argv[2] << "'\n";
      return 0;
    }

    // revhub branch -b <name> [from]  |  revhub branch <name> [from]
    const int at = flag == "-b" ? 2 : 1;
    if (argc <= at) {
      std::cerr << "usage: revhub branch -b <name> [from]\n";
      return 2;
    }
    const std::optional<std::string> from =
        argc > at + 1 ? std::optional<std::string>(argv[at + 1]) : std::nullopt;
    const auto r = repo->create_branch(argv[at], from);
    if (!r) {
      return revhub::cli::report("branch", r.error());
    }
    revhub::cli::save_repo(root, *repo);
    const auto &b = r.value();
    std::cout << "Branch '" << b.name << "' created from '" << b.forked_from << "'";
    if (b.tip) std::cout << " at " << revhub::abbrev(*b.tip);
    std::cout << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "branch: " << e.what() << "\n";
    return 1;
  }
}
