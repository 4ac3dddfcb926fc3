#include "cli/session.hpp"

#include "revhub/pull_request.hpp"
#include "revhub/repo.hpp"
#include "revhub/time.hpp"
#include "revhub/util.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using revhub::cli::with_repo;

namespace {

void print_line(const revhub::PullRequest &pr) {
  std::cout << revhub::pr_summary_line(pr) << "\n";
}

void print_detail(const revhub::PullRequest &pr) {
  print_line(pr);
  if (pr.closed_at) {
    std::cout << "  closed:  " << revhub::timeutil::format_timestamp(*pr.closed_at) << "\n";
  }
  if (pr.merge_commit) std::cout << "  merged as " << *pr.merge_commit << "\n";
  if (pr.reviews.empty()) {
    std::cout << "  (no reviews)\n";
    return;
  }
  std::size_t n = 0;
  for (const auto &r : pr.reviews) {
    std::cout << "  [" << ++n << "] (" << revhub::timeutil::format_timestamp(r.at) << ") "
              << r.reviewer << ": " << r.comment << "\n";
  }
}

int usage() {
  std::cerr << "usage: revhub pr create <source> <destination>\n"
               "       revhub pr review <id> <comment...>\n"
               "       revhub pr status | list | next | clear\n"
               "       revhub pr show <id>\n"
               "       revhub pr tag <id> <label>\n"
               "       revhub pr approve <id>\n"
               "       revhub pr reject <id> [reason...]\n";
  return 2;
}

std::string join_args(int argc, char **argv, int from) {
  return revhub::strutil::join(revhub::cli::args_from(argc, argv, from), " ");
}

// Subcommands that act on one pull request: review, tag, approve, reject.
int act_on(const std::string &sub, std::uint64_t id, const std::string &text) {
  return with_repo("pr", [&](const auto &root, revhub::Repository &repo) {
    auto r = sub == "review"    ? repo.pr_review(id, text)
             : sub == "tag"     ? repo.pr_tag(id, text)
             : sub == "approve" ? repo.pr_approve(id)
                                : repo.pr_reject(id, text);
    if (!r) return revhub::cli::report("pr", r.error());
    revhub::cli::save_repo(root, repo);
    const auto &pr = r.value();
    if (sub == "approve") {
      std::cout << "Pull request #" << pr.id << " merged as "
                << revhub::abbrev(pr.merge_commit.value_or("")) << "\n";
    } else if (sub == "reject") {
      std::cout << "Pull request #" << pr.id << " rejected\n";
    } else {
      print_line(pr);
    }
    return 0;
  });
}

} // namespace

int cmd_pr(int argc, char **argv) {
  if (argc < 2) {
    return usage();
  }
  const std::string sub = argv[1];

  if (sub == "create") {
    if (argc < 4) return usage();
    const std::string source = argv[2];
    const std::string destination = argv[3];
    return with_repo("pr", [&](const auto &root, revhub::Repository &repo) {
      const auto r = repo.pr_create(source, destination);
      if (!r) return revhub::cli::report("pr", r.error());
      revhub::cli::save_repo(root, repo);
      std::cout << "Created " << r.value().title << " by " << r.value().author << "\n";
      return 0;
    });
  }

  if (sub == "review" || sub == "tag" || sub == "approve" || sub == "reject" || sub == "show") {
    if (argc < 3) return usage();
    std::uint64_t id = 0;
    if (!revhub::cli::parse_id(argv[2], id)) {
      std::cerr << "pr: invalid pull request id '" << argv[2] << "'\n";
      return 2;
    }
    if (sub == "show") {
      return with_repo("pr", [&](const auto &, revhub::Repository &repo) {
        const auto r = repo.pr_show(id);
        if (!r) return revhub::cli::report("pr", r.error());
        if (!r.value()) {
          std::cout << "Pull request #" << id << " not found\n";
          return 1;
        }
        print_detail(*r.value());
        return 0;
      });
    }
    const std::string text = join_args(argc, argv, 3);
    if ((sub == "review" || sub == "tag") && text.empty()) return usage();
    return act_on(sub, id, text);
  }

  if (sub == "status") {
    return with_repo("pr", [](const auto &, revhub::Repository &repo) {
      const auto r = repo.pr_status();
      if (!r) return revhub::cli::report("pr", r.error());
      const auto &s = r.value();
      std::cout << "open:        " << s.open << "\n"
                << "en_revision: " << s.in_revision << "\n"
                << "merged:      " << s.merged << "\n"
                << "rejected:    " << s.rejected << "\n";
      if (s.next) {
        std::cout << "next:        #" << *s.next << "\n";
      } else {
        std::cout << "next:        (queue empty)\n";
      }
      return 0;
    });
  }

  if (sub == "list") {
    return with_repo("pr", [](const auto &, revhub::Repository &repo) {
      const auto r = repo.pr_list();
      if (!r) return revhub::cli::report("pr", r.error());
      std::cout << "Active:\n";
      if (r.value().active.empty()) std::cout << "  (none)\n";
      for (const auto &pr : r.value().active) print_line(pr);
      std::cout << "\nClosed:\n";
      if (r.value().closed.empty()) std::cout << "  (none)\n";
      for (const auto &pr : r.value().closed) print_line(pr);
      return 0;
    });
  }

  if (sub == "next") {
    return with_repo("pr", [](const auto &root, revhub::Repository &repo) {
      const auto r = repo.pr_next();
      if (!r) return revhub::cli::report("pr", r.error());
      if (!r.value()) {
        std::cout << "Queue empty\n";
        return 0;
      }
      revhub::cli::save_repo(root, repo);
      print_detail(*r.value());
      return 0;
    });
  }

  if (sub == "clear") {
    return with_repo("pr", [](const auto &root, revhub::Repository &repo) {
      const auto r = repo.pr_clear();
      if (!r) return revhub::cli::report("pr", r.error());
      revhub::cli::save_repo(root, repo);
      std::cout << "Dropped " << r.value() << " active pull request(s)\n";
      return 0;
    });
  }

  std::cerr << "pr: unknown subcommand '" << sub << "'\n";
  return usage();
}
