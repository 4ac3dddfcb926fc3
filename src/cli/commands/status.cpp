#include "cli/session.hpp"

#include "revhub/repo.hpp"
#include "revhub/util.hpp"

#include <filesystem>
#include <iostream>
#include <vector>

int cmd_status(int /*argc*/, char ** /*argv*/) {
  const auto root = std::filesystem::current_path();
  if (!revhub::cli::is_repo(root)) {
    return revhub::cli::not_a_repo("status");
  }
  try {
    const auto repo = revhub::cli::open_repo(root);
    const auto r = repo->status();
    if (!r) {
      return revhub::cli::report("status", r.error());
    }
    const auto &st = r.value();
    std::cout << "On branch " << st.head << "\n";
    if (st.tip) {
      std::cout << "At commit " << revhub::abbrev(*st.tip) << "\n\n";
    } else {
      std::cout << "No commits yet\n\n";
    }

    std::vector<revhub::StagingEntry> selected;
    std::vector<revhub::StagingEntry> pending;
    for (const auto &e : st.staged) {
      (e.included ? selected : pending).push_back(e);
    }

    auto print_changes = [](const char *header, const std::vector<revhub::StagingEntry> &xs) {
      std::cout << header << "\n";
      for (const auto &e : xs) {
        std::cout << "  " << revhub::change_kind_code(e.kind) << "  " << e.path << "\n";
      }
      if (xs.empty())
        std::cout << "  (none)\n";
      std::cout << "\n";
    };

    print_changes("Changes to be committed:", selected);
    print_changes("Staged but not selected:", pending);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}
