#include "cli/session.hpp"

#include "revhub/repo.hpp"
#include "revhub/util.hpp"

#include <filesystem>
#include <iostream>

int cmd_merge(int argc, char **argv) {
  if (argc < 3) {
    std::cerr << "usage: revhub merge <source> <destination>\n";
    return 2;
  }
  const auto root = std::filesystem::current_path();
  if (!revhub::cli::is_repo(root)) {
    return revhub::cli::not_a_repo("merge");
  }
  try {
    auto repo = revhub::cli::open_repo(root);
    const auto r = repo->merge(argv[1], argv[2]);
    if (!r) {
      return revhub::cli::report("merge", r.error());
    }
    revhub::cli::save_repo(root, *repo);
    const auto &m = r.value();
    std::cout << "Merged '" << m.source << "' into '" << m.destination << "' as "
              << revhub::abbrev(m.commit_id) << "\n";
    if (m.contributed.empty()) {
      std::cout << "  (no new files from source)\n";
    }
    for (const auto &p : m.contributed) std::cout << "  " << p << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "merge: " << e.what() << "\n";
    return 1;
  }
}
