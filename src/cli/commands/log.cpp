#include "cli/session.hpp"

#include "revhub/commit_graph.hpp"
#include "revhub/repo.hpp"
#include "revhub/time.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

int cmd_log(int argc, char **argv) {
  const auto root = std::filesystem::current_path();
  if (!revhub::cli::is_repo(root)) {
    return revhub::cli::not_a_repo("log");
  }
  try {
    const auto repo = revhub::cli::open_repo(root);

    // Default: HEAD's lineage. --all: every branch.
    std::optional<std::string> branch;
    if (argc >= 2 && std::string(argv[1]) == "--all") {
      branch = std::nullopt;
    } else if (argc >= 2) {
      branch = argv[1];
    } else {
      const auto st = repo->status();
      if (!st) return revhub::cli::report("log", st.error());
      branch = st.value().head;
    }

    const auto r = repo->log(branch);
    if (!r) {
      return revhub::cli::report("log", r.error());
    }
    if (r.value().empty()) {
      std::cout << "(no commits)\n";
      return 0;
    }
    for (const auto &c : r.value()) {
      std::cout << "commit " << c.id;
      if (c.kind == revhub::CommitKind::Merge && c.merged_from) {
        std::cout << " (merge of " << *c.merged_from << ")";
      }
      std::cout << "\n";
      std::cout << "Author: " << c.author << "\n";
      std::cout << "Date:   " << revhub::timeutil::format_timestamp(c.timestamp) << " "
                << revhub::timeutil::tz_offset_string(
                       revhub::timeutil::local_utc_offset_minutes(c.timestamp))
                << "\n";
      std::cout << "Branch: " << c.branch << "\n\n";
      std::cout << "    " << c.message << "\n";
      for (const auto &fc : c.changes) {
        std::cout << "    " << revhub::change_kind_code(fc.kind) << "  " << fc.path << "\n";
      }
      std::cout << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "log: " << e.what() << "\n";
    return 1;
  }
}
