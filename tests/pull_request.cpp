#include "revhub/access.hpp"
#include "revhub/branches.hpp"
#include "revhub/commit_graph.hpp"
#include "revhub/error.hpp"
#include "revhub/pull_request.hpp"
#include "revhub/time.hpp"

#include <iostream>
#include <string>

using revhub::ErrorCode;
using revhub::PrState;

template <typename Fn>
static bool throws_code(Fn &&fn, ErrorCode code, std::string *what = nullptr) {
  try {
    fn();
  } catch (const revhub::Error &e) {
    if (what != nullptr) *what = e.what();
    return e.code() == code;
  }
  return false;
}

int main() {
  try {
    revhub::CommitGraph graph;
    revhub::BranchStore branches{0};
    revhub::AccessControl access;
    access.grant_role("lead@example.com", "maintainer", {"merge"});
    const revhub::MergeContext ctx{.graph = graph, .branches = branches, .access = access};

    (void)branches.create("empty", "main", 1);
    (void)branches.create("feature", "main", 1);
    revhub::Commit c{};
    c.author    = "dev@example.com";
    c.timestamp = 2;
    c.branch    = "feature";
    c.message   = "work";
    c.changes   = {{"f.txt", revhub::ChangeKind::Added}};
    branches.set_tip("feature", graph.append(c).id);

    revhub::PullRequestQueue q;

    std::string what;
    if (!throws_code([&] { (void)q.create(branches, "no-existo", "main", "dev@example.com", 3); },
                     ErrorCode::BranchNotFound, &what) ||
        what.find("no-existo") == std::string::npos) {
      std::cerr << "missing branch should be BranchNotFound naming it: " << what << "\n";
      return 1;
    }
    if (!throws_code([&] { (void)q.create(branches, "feature", "feature", "dev@example.com", 3); },
                     ErrorCode::SameBranch) ||
        q.last_id() != 0) {
      std::cerr << "failed creates must not consume ids\n";
      return 1;
    }

    const auto pr1 = q.create(branches, "feature", "main", "dev@example.com", 3);
    const auto pr2 = q.create(branches, "feature", "main", "dev@example.com", 4);
    if (pr1.id != 1 || pr2.id != 2 || pr1.state != PrState::Open ||
        pr1.title != "PR #1: Merge feature into main") {
      std::cerr << "create mismatch: " << pr1.title << "\n";
      return 1;
    }

    const std::string line = revhub::pr_summary_line(pr1);
    if (line.rfind("#1  [open]  PR #1: Merge feature into main", 0) != 0 ||
        line.find("by dev@example.com at " + revhub::timeutil::format_timestamp(3)) ==
            std::string::npos) {
      std::cerr << "listing line should carry author and creation time: " << line << "\n";
      return 1;
    }

    auto r = q.review(1, "rev@example.com", "looks fine", 5);
    r = q.review(1, "rev@example.com", "one nit", 6);
    if (r.state != PrState::InRevision || r.reviews.size() != 2 ||
        r.reviews[1].comment != "one nit") {
      std::cerr << "review should move to en_revision and keep every comment\n";
      return 1;
    }
    (void)q.tag(1, "urgent");
    r = q.tag(1, "urgent");
    if (r.tags.size() != 2) {
      std::cerr << "duplicate tags should be kept\n";
      return 1;
    }
    if (!throws_code([&] { (void)q.tag(1, ""); }, ErrorCode::InvalidArgument) ||
        !throws_code([&] { (void)q.tag(99, "x"); }, ErrorCode::PRNotFound) ||
        !throws_code([&] { (void)q.review(99, "rev@example.com", "?", 7); },
                     ErrorCode::PRNotFound)) {
      std::cerr << "tag/review error codes mismatch\n";
      return 1;
    }

    auto s = q.summary();
    if (s.open != 1 || s.in_revision != 1 || s.next != 1U) {
      std::cerr << "summary mismatch before approval\n";
      return 1;
    }

    // Approval needs merge permission; a denial leaves the PR queued.
    if (!throws_code([&] { (void)q.approve(1, ctx, "dev@example.com", 8); },
                     ErrorCode::PermissionDenied) ||
        !q.find(1) || q.find(1)->closed()) {
      std::cerr << "unauthorized approve should leave PR active\n";
      return 1;
    }
    const auto merged = q.approve(1, ctx, "lead@example.com", 9);
    if (merged.state != PrState::Merged || !merged.merge_commit || merged.closed_at != 9 ||
        branches.get("main").tip != merged.merge_commit) {
      std::cerr << "approve should merge and archive\n";
      return 1;
    }
    if (!throws_code([&] { (void)q.approve(1, ctx, "lead@example.com", 10); },
                     ErrorCode::PRNotFound)) {
      std::cerr << "closed PR is no longer active\n";
      return 1;
    }

    const auto rejected = q.reject(2, "rev@example.com", "not needed", 11);
    if (rejected.state != PrState::Rejected || rejected.merge_commit ||
        rejected.reviews.back().comment != "Rejected: not needed") {
      std::cerr << "reject mismatch\n";
      return 1;
    }

    auto listing = q.list();
    if (!listing.active.empty() || listing.closed.size() != 2 || listing.closed[0].id != 1 ||
        listing.closed[1].id != 2) {
      std::cerr << "closed archive should hold both PRs in closure order\n";
      return 1;
    }
    if (q.next()) {
      std::cerr << "next on empty queue should be nullopt\n";
      return 1;
    }

    // A failed merge keeps the PR active.
    const auto pr3 = q.create(branches, "empty", "main", "dev@example.com", 12);
    if (!throws_code([&] { (void)q.approve(pr3.id, ctx, "lead@example.com", 13); },
                     ErrorCode::EmptyCommit) ||
        q.list().active.size() != 1) {
      std::cerr << "failed merge should leave the PR queued\n";
      return 1;
    }

    // next() pops in FIFO order without changing state.
    const auto pr4 = q.create(branches, "feature", "main", "dev@example.com", 14);
    const auto head = q.next();
    if (!head || head->id != pr3.id || head->state != PrState::Open ||
        q.list().active.size() != 1 || q.list().active[0].id != pr4.id) {
      std::cerr << "next should pop the oldest active PR\n";
      return 1;
    }

    (void)q.create(branches, "feature", "main", "dev@example.com", 15);
    if (q.clear() != 2 || !q.list().active.empty() || q.list().closed.size() != 2) {
      std::cerr << "clear should empty only the active queue\n";
      return 1;
    }
    if (q.create(branches, "feature", "main", "dev@example.com", 16).id != 6) {
      std::cerr << "ids must never be reused\n";
      return 1;
    }

    s = q.summary();
    if (s.open != 1 || s.merged != 1 || s.rejected != 1 || s.next != 6U) {
      std::cerr << "summary mismatch at end\n";
      return 1;
    }
    if (revhub::pr_state_name(PrState::InRevision) != "en_revision" ||
        revhub::pr_state_from_name("merged") != PrState::Merged) {
      std::cerr << "state names mismatch\n";
      return 1;
    }

    std::cout << "pull request test OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
