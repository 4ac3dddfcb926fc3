#include "cli/session.hpp"

#include "revhub/config.hpp"
#include "revhub/consts.hpp"
#include "revhub/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_init(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: revhub init <name>\n";
    return 2;
  }
  try {
    const std::filesystem::path root = std::filesystem::current_path();
    if (revhub::cli::is_repo(root)) {
      std::cerr << "init: a revhub repository already exists at "
                << (root / revhub::consts::kStateDir) << "\n";
      return 1;
    }
    // Keep an identity written by `revhub config`; otherwise fall back to a placeholder.
    revhub::Identity owner = revhub::load_identity(root);
    if (owner.email.empty()) {
      owner = revhub::Identity{.name = "Your Name", .email = "you@example.com"};
      revhub::save_identity(root, owner);
    }

    revhub::Repository repo;
    if (const auto r = repo.init(argv[1], owner); !r) {
      return revhub::cli::report("init", r.error());
    }
    revhub::cli::save_repo(root, repo);
    std::cout << "Initialized empty revhub repository '" << argv[1] << "' in "
              << (root / revhub::consts::kStateDir) << "\n";
    std::cout << owner.email << " is admin\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
