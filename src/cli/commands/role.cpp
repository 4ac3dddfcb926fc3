#include "cli/session.hpp"

#include "revhub/access.hpp"
#include "revhub/repo.hpp"
#include "revhub/util.hpp"

#include <iostream>
#include <string>
#include <vector>

using revhub::cli::with_repo;

namespace {

void print_record(const revhub::RoleRecord &rec) {
  const std::vector<std::string> perms(rec.permissions.begin(), rec.permissions.end());
  std::cout << rec.email << "  " << rec.role << "  ["
            << revhub::strutil::join(perms, ", ", "no permissions") << "]\n";
}

// "push,merge" "pull" -> {push, merge, pull}
std::vector<std::string> permission_args(int argc, char **argv, int from) {
  std::vector<std::string> out;
  for (const auto &a : revhub::cli::args_from(argc, argv, from)) {
    for (auto &p : revhub::strutil::split_list(a)) out.push_back(revhub::strutil::to_lower(p));
  }
  return out;
}

int usage() {
  std::cerr << "usage: revhub role add <email> <role> [permission...]\n"
               "       revhub role update <email> <role> [permission...]\n"
               "       revhub role check <email> <permission>\n"
               "       revhub role remove <email>\n"
               "       revhub role show <email>\n"
               "       revhub role list\n";
  return 2;
}

} // namespace

int cmd_role(int argc, char **argv) {
  if (argc < 2) {
    return usage();
  }
  const std::string sub = argv[1];

  if (sub == "add" || sub == "update") {
    if (argc < 4) return usage();
    const std::string email = argv[2];
    const std::string role = argv[3];
    const auto perms = permission_args(argc, argv, 4);
    return with_repo("role", [&](const auto &root, revhub::Repository &repo) {
      const auto r = sub == "add" ? repo.role_add(email, role, perms)
                                  : repo.role_update(email, role, perms);
      if (!r) return revhub::cli::report("role", r.error());
      revhub::cli::save_repo(root, repo);
      std::cout << (sub == "add" ? "Granted " : "Updated ");
      print_record(r.value());
      return 0;
    });
  }

  if (sub == "check") {
    if (argc < 4) return usage();
    const std::string email = argv[2];
    const std::string perm = argv[3];
    return with_repo("role", [&](const auto &, revhub::Repository &repo) {
      const auto r = repo.role_check(email, perm);
      if (!r) return revhub::cli::report("role", r.error());
      std::cout << email << (r.value() ? " has " : " does not have ") << "'" << perm
                << "' permission\n";
      return r.value() ? 0 : 1;
    });
  }

  if (sub == "remove") {
    if (argc < 3) return usage();
    const std::string email = argv[2];
    return with_repo("role", [&](const auto &root, revhub::Repository &repo) {
      const auto r = repo.role_remove(email);
      if (!r) return revhub::cli::report("role", r.error());
      revhub::cli::save_repo(root, repo);
      std::cout << "Removed role of " << email << "\n";
      return 0;
    });
  }

  if (sub == "show") {
    if (argc < 3) return usage();
    const std::string email = argv[2];
    return with_repo("role", [&](const auto &, revhub::Repository &repo) {
      const auto r = repo.role_show(email);
      if (!r) return revhub::cli::report("role", r.error());
      if (!r.value()) {
        std::cout << email << " has no role\n";
        return 0;
      }
      print_record(*r.value());
      return 0;
    });
  }

  if (sub == "list") {
    return with_repo("role", [](const auto &, revhub::Repository &repo) {
      const auto r = repo.role_list();
      if (!r) return revhub::cli::report("role", r.error());
      if (r.value().empty()) std::cout << "(no roles)\n";
      for (const auto &rec : r.value()) print_record(rec);
      return 0;
    });
  }

  std::cerr << "role: unknown subcommand '" << sub << "'\n";
  return usage();
}
