#include "cli/session.hpp"

#include "revhub/repo.hpp"
#include "revhub/staging.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_stage(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: revhub stage list | toggle <path> | clear | clear_selected\n";
    return 2;
  }
  const std::string sub = argv[1];
  const auto root = std::filesystem::current_path();
  if (!revhub::cli::is_repo(root)) {
    return revhub::cli::not_a_repo("stage");
  }
  try {
    auto repo = revhub::cli::open_repo(root);

    if (sub == "list") {
      const auto r = repo->stage_list();
      if (!r) return revhub::cli::report("stage", r.error());
      if (r.value().empty()) {
        std::cout << "(nothing staged)\n";
        return 0;
      }
      for (const auto &e : r.value()) {
        std::cout << (e.included ? "[x] " : "[ ] ") << revhub::change_kind_code(e.kind) << "  "
                  << e.path << "\n";
      }
      return 0;
    }

    if (sub == "toggle") {
      if (argc < 3) {
        std::cerr << "usage: revhub stage toggle <path>\n";
        return 2;
      }
      const auto r = repo->stage_toggle(argv[2]);
      if (!r) return revhub::cli::report("stage", r.error());
      revhub::cli::save_repo(root, *repo);
      std::cout << argv[2] << (r.value() ? " selected" : " deselected") << "\n";
      return 0;
    }

    if (sub == "clear" || sub == "clear_selected") {
      const auto r = sub == "clear" ? repo->stage_clear() : repo->stage_clear_included();
      if (!r) return revhub::cli::report("stage", r.error());
      revhub::cli::save_repo(root, *repo);
      std::cout << "Removed " << r.value() << " staged entr" << (r.value() == 1 ? "y" : "ies")
                << "\n";
      return 0;
    }

    std::cerr << "stage: unknown subcommand '" << sub << "'\n";
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "stage: " << e.what() << "\n";
    return 1;
  }
}
