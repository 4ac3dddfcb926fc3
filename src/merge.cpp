#include "revhub/merge.hpp"

#include "revhub/consts.hpp"
#include "revhub/error.hpp"

#include <algorithm>
#include <set>

namespace revhub {

auto merge_branches(const MergeContext &ctx, std::string_view source,
                    std::string_view destination, std::string_view actor, std::time_t now)
    -> MergeResult {
  ctx.access.require(actor, consts::kPermMerge,
                     "merge into '" + std::string(destination) + "'");

  const Branch &src = ctx.branches.get(source);
  const Branch &dst = ctx.branches.get(destination);
  if (src.name == dst.name) {
    throw Error(ErrorCode::SameBranch, "cannot merge branch '" + src.name + "' into itself");
  }
  if (!src.tip) {
    throw Error(ErrorCode::EmptyCommit,
                "branch '" + src.name + "' has no commits; nothing to merge");
  }

  // Commits already in destination's history, including earlier merges.
  const std::set<std::string> dst_history = ctx.graph.ancestry(dst.tip);

  const auto src_state = ctx.graph.fold(src.tip);
  const auto dst_state = ctx.graph.fold(dst.tip);

  // Source-side changes in source commit order (oldest first), so the merge
  // lists paths the way they were introduced.
  std::vector<const Commit *> src_chain;
  for (const Commit &c : ctx.graph.lineage(src.tip)) src_chain.push_back(&c);
  std::ranges::reverse(src_chain);

  std::vector<FileChange> contributed;
  std::set<std::string> seen;
  for (const Commit *c : src_chain) {
    for (const auto &fc : c->changes) {
      const auto &latest = src_state.at(fc.path);
      if (latest.commit_id != c->id || dst_history.contains(c->id)) continue;
      if (!seen.insert(fc.path).second) continue;
      if (latest.kind == ChangeKind::Deleted) {
        // Deleting something destination never had is a no-op.
        const auto it = dst_state.find(fc.path);
        if (it == dst_state.end() || it->second.kind == ChangeKind::Deleted) continue;
      }
      contributed.push_back(FileChange{.path = fc.path, .kind = latest.kind});
    }
  }

  // Destination tip's files first, then what source contributes; a path in
  // both takes the source change.
  std::vector<FileChange> changes;
  if (dst.tip) {
    const Commit *tip = ctx.graph.find(*dst.tip);
    if (tip != nullptr) changes = tip->changes;
  }
  for (const auto &fc : contributed) {
    const auto it = std::ranges::find(changes, fc.path, &FileChange::path);
    if (it != changes.end()) {
      it->kind = fc.kind;
    } else {
      changes.push_back(fc);
    }
  }

  Commit merge_commit{};
  merge_commit.parent      = dst.tip;
  merge_commit.author      = std::string(actor);
  merge_commit.timestamp   = now;
  merge_commit.branch      = dst.name;
  merge_commit.message     = "Merge branch '" + src.name + "' into " + dst.name;
  merge_commit.changes     = std::move(changes);
  merge_commit.kind        = CommitKind::Merge;
  merge_commit.merged_from = src.tip;

  const std::string dst_name = dst.name;
  const Commit &stored = ctx.graph.append(std::move(merge_commit));
  ctx.branches.set_tip(dst_name, stored.id);

  MergeResult result{.commit_id = stored.id, .source = src.name, .destination = dst_name,
                     .contributed = {}};
  for (const auto &fc : contributed) result.contributed.push_back(fc.path);
  return result;
}

} // namespace revhub
