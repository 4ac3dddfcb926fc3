#pragma once
#include "revhub/access.hpp"
#include "revhub/branches.hpp"
#include "revhub/commit_graph.hpp"
#include "revhub/config.hpp"
#include "revhub/consts.hpp"
#include "revhub/error.hpp"
#include "revhub/merge.hpp"
#include "revhub/pull_request.hpp"
#include "revhub/staging.hpp"
#include "revhub/time.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace revhub {

struct RepositoryOptions {
  timeutil::Clock clock = timeutil::system_clock();
};

struct BranchListing {
  std::vector<Branch> branches; // sorted by name
  std::string head;
  std::vector<std::pair<std::string, std::size_t>> tree; // (name, depth), pre-order
};

struct StatusReport {
  std::string head;
  std::optional<std::string> tip;
  std::vector<StagingEntry> staged;
};

// Everything a repository owns, in a plain form for persistence.
struct RepositoryState {
  std::string name;
  std::string head;
  std::vector<Branch> branches;
  std::vector<Commit> commits; // insertion order, parents first
  std::map<std::string, std::vector<StagingEntry>, std::less<>> staging;
  std::vector<Contributor> contributors;
  std::vector<RoleRecord> roles;
  std::vector<PullRequest> active_prs;
  std::vector<PullRequest> closed_prs;
  std::uint64_t last_pr_id = 0;
};

// The aggregate behind every command. Each operation returns a Result; typed
// failures never escape as exceptions. Commands without an explicit caller act
// as the identity set with set_actor().
//
// Thread-safe: mutations take an exclusive lock, queries a shared one.
class Repository {
public:
  explicit Repository(RepositoryOptions options = {});
  Repository(const Repository &) = delete;
  Repository &operator=(const Repository &) = delete;

  // Name the repository and make `owner` its admin and acting identity.
  // Fails with AlreadyInitialized on a second call.
  auto init(std::string_view name, const Identity &owner) -> Result<void>;

  [[nodiscard]] bool is_initialized() const;
  [[nodiscard]] auto name() const -> std::string;

  void set_actor(Identity actor);
  [[nodiscard]] auto actor() const -> Identity;

  // Branches
  // New branch at the tip of `from`, HEAD when omitted.
  auto create_branch(std::string_view name, const std::optional<std::string> &from = std::nullopt)
      -> Result<Branch>;
  // Also drops whatever was staged on the branch.
  auto delete_branch(std::string_view name) -> Result<void>;
  [[nodiscard]] auto list_branches() const -> Result<BranchListing>;
  auto checkout(std::string_view name) -> Result<void>;

  // Staging (always on HEAD)
  auto stage_add(const std::vector<std::string> &paths) -> Result<std::vector<StagingEntry>>;
  // Stage deletions; each path must be tracked by HEAD.
  auto stage_remove(const std::vector<std::string> &paths) -> Result<std::vector<StagingEntry>>;
  [[nodiscard]] auto stage_list() const -> Result<std::vector<StagingEntry>>;
  auto stage_toggle(std::string_view path) -> Result<bool>;
  auto stage_clear() -> Result<std::size_t>;
  auto stage_clear_included() -> Result<std::size_t>;

  // Commit the included entries of HEAD. Returns the new commit id.
  auto commit(std::string_view message) -> Result<std::string>;
  [[nodiscard]] auto status() const -> Result<StatusReport>;

  // One branch's lineage, or every reachable commit when `branch` is nullopt.
  // Most recent first.
  [[nodiscard]] auto log(const std::optional<std::string> &branch = std::nullopt) const
      -> Result<std::vector<Commit>>;

  auto merge(std::string_view source, std::string_view destination) -> Result<MergeResult>;

  // Contributors
  [[nodiscard]] auto list_contributors() const -> Result<std::vector<Contributor>>;
  // true when added, false when an existing contributor was relabelled.
  auto add_contributor(const std::string &name,
                       std::string_view label = consts::kDefaultContributorLabel)
      -> Result<bool>;
  auto remove_contributor(std::string_view name) -> Result<void>;
  [[nodiscard]] auto find_contributor(std::string_view name) const
      -> Result<std::optional<Contributor>>;

  // Roles; add, update and remove need the "admin" permission.
  auto role_add(std::string_view email, std::string_view role,
                const std::vector<std::string> &permissions) -> Result<RoleRecord>;
  auto role_update(std::string_view email, std::string_view role,
                   const std::vector<std::string> &permissions) -> Result<RoleRecord>;
  [[nodiscard]] auto role_check(std::string_view email, std::string_view permission) const
      -> Result<bool>;
  auto role_remove(std::string_view email) -> Result<void>;
  [[nodiscard]] auto role_show(std::string_view email) const -> Result<std::optional<RoleRecord>>;
  [[nodiscard]] auto role_list() const -> Result<std::vector<RoleRecord>>;

  // Pull requests
  auto pr_create(std::string_view source, std::string_view destination) -> Result<PullRequest>;
  auto pr_review(std::uint64_t id, std::string_view comment) -> Result<PullRequest>;
  [[nodiscard]] auto pr_status() const -> Result<PrSummary>;
  [[nodiscard]] auto pr_show(std::uint64_t id) const -> Result<std::optional<PullRequest>>;
  auto pr_tag(std::uint64_t id, std::string_view label) -> Result<PullRequest>;
  auto pr_approve(std::uint64_t id) -> Result<PullRequest>;
  auto pr_reject(std::uint64_t id, std::string_view reason = {}) -> Result<PullRequest>;
  [[nodiscard]] auto pr_list() const -> Result<PrListing>;
  // nullopt when the queue is empty.
  auto pr_next() -> Result<std::optional<PullRequest>>;
  auto pr_clear() -> Result<std::size_t>;

  // Persistence hooks
  [[nodiscard]] auto snapshot() const -> RepositoryState;
  // Replace all state. Fails with StateCorrupt and leaves the repository
  // untouched when `state` is inconsistent.
  auto restore(RepositoryState state) -> Result<void>;

private:
  void require_initialized() const;
  [[nodiscard]] auto merge_context() -> MergeContext;

  RepositoryOptions options_;
  mutable std::shared_mutex mutex_;

  std::string name_; // empty until init()
  Identity actor_;

  BranchStore branches_;
  StagingArea staging_;
  CommitGraph graph_;
  AccessControl access_;
  ContributorRegistry contributors_;
  PullRequestQueue prs_;
};

} // namespace revhub
