#include "cli/session.hpp"

#include "revhub/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_checkout(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: revhub checkout <branch>\n";
    return 2;
  }
  const auto root = std::filesystem::current_path();
  if (!revhub::cli::is_repo(root)) {
    return revhub::cli::not_a_repo("checkout");
  }
  try {
    auto repo = revhub::cli::open_repo(root);
    if (const auto r = repo->checkout(argv[1]); !r) {
      return revhub::cli::report("checkout", r.error());
    }
    revhub::cli::save_repo(root, *repo);
    std::cout << "Switched to branch '" << argv[1] << "'\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "checkout: " << e.what() << "\n";
    return 1;
  }
}
