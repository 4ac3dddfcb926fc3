#pragma once
#include "revhub/access.hpp"
#include "revhub/branches.hpp"
#include "revhub/commit_graph.hpp"

#include <ctime>
#include <string>
#include <string_view>
#include <vector>

namespace revhub {

// The pieces of the repository a merge reads and writes.
struct MergeContext {
  CommitGraph &graph;
  BranchStore &branches;
  const AccessControl &access;
};

struct MergeResult {
  std::string commit_id;
  std::string source;
  std::string destination;
  std::vector<std::string> contributed; // paths taken from source ("source wins")
};

// Fold `source` into `destination` as one single-parent Merge commit.
//
// Every path changed in source's lineage whose latest source change is not
// already part of destination's lineage is contributed. The new commit lists
// destination tip's files followed by the contributed paths and advances
// destination's tip.
//
// Throws Error(PermissionDenied) unless `actor` holds "merge";
// Error(BranchNotFound) for a missing branch; Error(SameBranch);
// Error(EmptyCommit) when source has no commits.
auto merge_branches(const MergeContext &ctx, std::string_view source,
                    std::string_view destination, std::string_view actor, std::time_t now)
    -> MergeResult;

} // namespace revhub
