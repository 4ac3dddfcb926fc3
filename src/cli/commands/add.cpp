#include "cli/session.hpp"

#include "revhub/repo.hpp"
#include "revhub/staging.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using stage_op = revhub::Result<std::vector<revhub::StagingEntry>> (revhub::Repository::*)(
    const std::vector<std::string> &);

int run_stage_op(std::string_view cmd, stage_op op, int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: revhub " << cmd << " <path>...\n";
    return 2;
  }
  const auto root = std::filesystem::current_path();
  if (!revhub::cli::is_repo(root)) {
    return revhub::cli::not_a_repo(cmd);
  }
  try {
    auto repo = revhub::cli::open_repo(root);
    const auto r = ((*repo).*op)(revhub::cli::args_from(argc, argv, 1));
    if (!r) {
      return revhub::cli::report(cmd, r.error());
    }
    revhub::cli::save_repo(root, *repo);
    for (const auto &e : r.value()) {
      std::cout << "staged " << revhub::change_kind_code(e.kind) << "  " << e.path
                << (e.included ? "  (selected)" : "") << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << cmd << ": " << e.what() << "\n";
    return 1;
  }
}

} // namespace

int cmd_add(int argc, char **argv) {
  return run_stage_op("add", &revhub::Repository::stage_add, argc, argv);
}

int cmd_rm(int argc, char **argv) {
  return run_stage_op("rm", &revhub::Repository::stage_remove, argc, argv);
}
