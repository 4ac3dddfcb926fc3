#include "revhub/access.hpp"
#include "revhub/branches.hpp"
#include "revhub/commit_graph.hpp"
#include "revhub/error.hpp"
#include "revhub/merge.hpp"

#include <iostream>
#include <string>
#include <vector>

using revhub::ChangeKind;
using revhub::ErrorCode;

namespace {

struct Fixture {
  revhub::CommitGraph graph;
  revhub::BranchStore branches{0};
  revhub::AccessControl access;

  revhub::MergeContext ctx() { return {.graph = graph, .branches = branches, .access = access}; }

  std::string commit_on(const std::string &branch, std::time_t t, const std::string &msg,
                        std::vector<revhub::FileChange> changes) {
    revhub::Commit c{};
    c.parent    = branches.get(branch).tip;
    c.author    = "dev@example.com";
    c.timestamp = t;
    c.branch    = branch;
    c.message   = msg;
    c.changes   = std::move(changes);
    const std::string id = graph.append(std::move(c)).id;
    branches.set_tip(branch, id);
    return id;
  }
};

template <typename Fn> bool throws_code(Fn &&fn, ErrorCode code) {
  try {
    fn();
  } catch (const revhub::Error &e) {
    return e.code() == code;
  }
  return false;
}

std::vector<std::string> paths(const revhub::Commit &c) { return c.paths(); }

} // namespace

int main() {
  try {
    Fixture fx;
    fx.access.grant_role("lead@example.com", "maintainer", {"push", "merge"});
    fx.access.grant_role("dev@example.com", "developer", {"push"});

    (void)fx.branches.create("early", "main", 1); // never gets a commit
    const std::string c1 = fx.commit_on("main", 2, "base", {{"a.txt", ChangeKind::Added}});
    (void)fx.branches.create("feature", "main", 3);
    const std::string c2 = fx.commit_on(
        "feature", 4, "feature work", {{"b.txt", ChangeKind::Added}, {"a.txt", ChangeKind::Modified}});
    const std::string c3 = fx.commit_on("main", 5, "main work", {{"c.txt", ChangeKind::Added}});

    // Permission is checked before anything moves.
    if (!throws_code([&] { (void)revhub::merge_branches(fx.ctx(), "feature", "main",
                                                        "dev@example.com", 6); },
                     ErrorCode::PermissionDenied) ||
        fx.branches.get("main").tip != c3) {
      std::cerr << "unauthorized merge should be denied without side effects\n";
      return 1;
    }
    if (!throws_code([&] { (void)revhub::merge_branches(fx.ctx(), "main", "main",
                                                        "lead@example.com", 6); },
                     ErrorCode::SameBranch)) {
      std::cerr << "self merge should be SameBranch\n";
      return 1;
    }
    if (!throws_code([&] { (void)revhub::merge_branches(fx.ctx(), "nope", "main",
                                                        "lead@example.com", 6); },
                     ErrorCode::BranchNotFound)) {
      std::cerr << "unknown source should be BranchNotFound\n";
      return 1;
    }
    if (!throws_code([&] { (void)revhub::merge_branches(fx.ctx(), "early", "main",
                                                        "lead@example.com", 6); },
                     ErrorCode::EmptyCommit)) {
      std::cerr << "source without commits should be EmptyCommit\n";
      return 1;
    }

    const auto m1 = revhub::merge_branches(fx.ctx(), "feature", "main", "lead@example.com", 7);
    if (m1.contributed != std::vector<std::string>{"b.txt", "a.txt"}) {
      std::cerr << "source-only changes should be contributed\n";
      return 1;
    }
    const revhub::Commit *mc = fx.graph.find(m1.commit_id);
    if (mc == nullptr || mc->kind != revhub::CommitKind::Merge || mc->parent != c3 ||
        mc->merged_from != c2 || mc->branch != "main" ||
        mc->message != "Merge branch 'feature' into main" ||
        paths(*mc) != std::vector<std::string>{"c.txt", "b.txt", "a.txt"}) {
      std::cerr << "merge commit malformed\n";
      return 1;
    }
    if (fx.branches.get("main").tip != m1.commit_id || fx.branches.get("feature").tip != c2) {
      std::cerr << "merge should advance only the destination\n";
      return 1;
    }

    // Nothing new on feature: the merge contributes nothing.
    const auto m2 = revhub::merge_branches(fx.ctx(), "feature", "main", "lead@example.com", 8);
    if (!m2.contributed.empty()) {
      std::cerr << "repeat merge should contribute nothing\n";
      return 1;
    }

    // A deletion on the source side wins over the destination's copy.
    (void)fx.commit_on("feature", 9, "drop a", {{"a.txt", ChangeKind::Deleted}});
    const auto m3 = revhub::merge_branches(fx.ctx(), "feature", "main", "lead@example.com", 10);
    if (m3.contributed != std::vector<std::string>{"a.txt"} ||
        fx.graph.tracks(fx.branches.get("main").tip, "a.txt") ||
        !fx.graph.tracks(fx.branches.get("main").tip, "c.txt")) {
      std::cerr << "source deletion should reach destination\n";
      return 1;
    }

    // Merging into an empty branch takes the source history as-is.
    (void)fx.branches.create("fresh", "early", 11);
    const auto m4 = revhub::merge_branches(fx.ctx(), "main", "fresh", "lead@example.com", 12);
    const revhub::Commit *fresh_tip = fx.graph.find(m4.commit_id);
    if (fresh_tip == nullptr || fresh_tip->parent || fresh_tip->kind != revhub::CommitKind::Merge ||
        !fx.graph.tracks(m4.commit_id, "b.txt") || c1.empty()) {
      std::cerr << "merge into empty branch malformed\n";
      return 1;
    }

    std::cout << "merge test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
