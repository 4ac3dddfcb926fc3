#include "cli/session.hpp"

#include "revhub/consts.hpp"
#include "revhub/repo.hpp"

#include <iostream>
#include <string>
#include <string_view>

using revhub::cli::with_repo;

int cmd_contributors(int /*argc*/, char ** /*argv*/) {
  return with_repo("contributors", [](const auto &, revhub::Repository &repo) {
    const auto r = repo.list_contributors();
    if (!r) return revhub::cli::report("contributors", r.error());
    if (r.value().empty()) {
      std::cout << "(no contributors)\n";
    }
    for (const auto &c : r.value()) std::cout << c.name << "  (" << c.label << ")\n";
    return 0;
  });
}

int cmd_add_contributor(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: revhub add-contributor <name> [label]\n";
    return 2;
  }
  const std::string name = argv[1];
  const std::string label =
      argc >= 3 ? std::string(argv[2]) : std::string(revhub::consts::kDefaultContributorLabel);
  return with_repo("add-contributor", [&](const auto &root, revhub::Repository &repo) {
    const auto r = repo.add_contributor(name, label);
    if (!r) return revhub::cli::report("add-contributor", r.error());
    revhub::cli::save_repo(root, repo);
    std::cout << (r.value() ? "Added" : "Updated") << " contributor '" << name << "' (" << label
              << ")\n";
    return 0;
  });
}

int cmd_remove_contributor(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: revhub remove-contributor <name>\n";
    return 2;
  }
  const std::string name = argv[1];
  return with_repo("remove-contributor", [&](const auto &root, revhub::Repository &repo) {
    const auto r = repo.remove_contributor(name);
    if (!r) return revhub::cli::report("remove-contributor", r.error());
    revhub::cli::save_repo(root, repo);
    std::cout << "Removed contributor '" << name << "'\n";
    return 0;
  });
}

int cmd_find_contributor(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: revhub find-contributor <name>\n";
    return 2;
  }
  const std::string name = argv[1];
  return with_repo("find-contributor", [&](const auto &, revhub::Repository &repo) {
    const auto r = repo.find_contributor(name);
    if (!r) return revhub::cli::report("find-contributor", r.error());
    if (!r.value()) {
      std::cout << "Contributor '" << name << "' not found\n";
      return 0;
    }
    std::cout << r.value()->name << "  (" << r.value()->label << ")\n";
    return 0;
  });
}
