#include "revhub/repo.hpp"

#include "revhub/consts.hpp"
#include "revhub/error.hpp"

#include <algorithm>
#include <mutex>
#include <set>
#include <utility>

namespace {

using revhub::Error;
using revhub::ErrorCode;

void require_paths(const std::vector<std::string> &paths) {
  if (paths.empty()) {
    throw Error(ErrorCode::InvalidArgument, "no paths given");
  }
  if (std::ranges::any_of(paths, [](const std::string &p) { return p.empty(); })) {
    throw Error(ErrorCode::InvalidArgument, "cannot stage an empty path");
  }
  for (const auto &p : paths) {
    const bool control = std::ranges::any_of(
        p, [](char c) { return static_cast<unsigned char>(c) < 0x20 || c == '\x7f'; });
    if (control) {
      throw Error(ErrorCode::InvalidArgument, "path contains a control character: " + p);
    }
  }
}

// Entries of `list` named in `paths`, in staging order.
[[nodiscard]] auto pick(const std::vector<revhub::StagingEntry> &list,
                        const std::vector<std::string> &paths)
    -> std::vector<revhub::StagingEntry> {
  const std::set<std::string_view> wanted(paths.begin(), paths.end());
  std::vector<revhub::StagingEntry> out;
  for (const auto &e : list) {
    if (wanted.contains(e.path)) out.push_back(e);
  }
  return out;
}

} // namespace

namespace revhub {

Repository::Repository(RepositoryOptions options) : options_(std::move(options)) {
  if (!options_.clock) options_.clock = timeutil::system_clock();
}

void Repository::require_initialized() const {
  if (name_.empty()) {
    throw Error(ErrorCode::NotInitialized, "repository is not initialized (run `revhub init`)");
  }
}

auto Repository::merge_context() -> MergeContext {
  return MergeContext{.graph = graph_, .branches = branches_, .access = access_};
}

auto Repository::init(std::string_view name, const Identity &owner) -> Result<void> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    if (!name_.empty()) {
      throw Error(ErrorCode::AlreadyInitialized,
                  "repository '" + name_ + "' is already initialized");
    }
    if (name.empty()) {
      throw Error(ErrorCode::InvalidArgument, "repository name must not be empty");
    }
    if (owner.email.empty()) {
      throw Error(ErrorCode::InvalidArgument, "owner email must not be empty");
    }
    const auto &admin = role_catalogue().at(std::string(consts::kRoleAdmin));
    access_.grant_role(owner.email, consts::kRoleAdmin,
                       std::vector<std::string>(admin.begin(), admin.end()));
    branches_ = BranchStore(options_.clock());
    name_  = std::string(name);
    actor_ = owner;
  });
}

bool Repository::is_initialized() const {
  std::shared_lock lock(mutex_);
  return !name_.empty();
}

auto Repository::name() const -> std::string {
  std::shared_lock lock(mutex_);
  return name_;
}

void Repository::set_actor(Identity actor) {
  std::unique_lock lock(mutex_);
  actor_ = std::move(actor);
}

auto Repository::actor() const -> Identity {
  std::shared_lock lock(mutex_);
  return actor_;
}

// Branches

auto Repository::create_branch(std::string_view name, const std::optional<std::string> &from)
    -> Result<Branch> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    const std::string origin = from ? *from : branches_.head();
    return branches_.create(name, origin, options_.clock());
  });
}

auto Repository::delete_branch(std::string_view name) -> Result<void> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    branches_.remove(name);
    staging_.clear(name);
  });
}

auto Repository::list_branches() const -> Result<BranchListing> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return BranchListing{.branches = branches_.list(), .head = branches_.head(),
                         .tree = branches_.tree()};
  });
}

auto Repository::checkout(std::string_view name) -> Result<void> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    branches_.checkout(name);
  });
}

// Staging

auto Repository::stage_add(const std::vector<std::string> &paths)
    -> Result<std::vector<StagingEntry>> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    require_paths(paths);
    const Branch &head = branches_.head_branch();
    const std::time_t now = options_.clock();
    for (const auto &p : paths) {
      const ChangeKind kind =
          graph_.tracks(head.tip, p) ? ChangeKind::Modified : ChangeKind::Added;
      staging_.add(head.name, p, kind, now);
    }
    return pick(staging_.list(head.name), paths);
  });
}

auto Repository::stage_remove(const std::vector<std::string> &paths)
    -> Result<std::vector<StagingEntry>> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    require_paths(paths);
    const Branch &head = branches_.head_branch();
    for (const auto &p : paths) {
      if (!graph_.tracks(head.tip, p)) {
        throw Error(ErrorCode::StagingEntryNotFound,
                    "'" + p + "' is not tracked on branch '" + head.name + "'");
      }
    }
    const std::time_t now = options_.clock();
    for (const auto &p : paths) staging_.add(head.name, p, ChangeKind::Deleted, now);
    return pick(staging_.list(head.name), paths);
  });
}

auto Repository::stage_list() const -> Result<std::vector<StagingEntry>> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return staging_.list(branches_.head());
  });
}

auto Repository::stage_toggle(std::string_view path) -> Result<bool> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return staging_.toggle(branches_.head(), path);
  });
}

auto Repository::stage_clear() -> Result<std::size_t> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return staging_.clear(branches_.head());
  });
}

auto Repository::stage_clear_included() -> Result<std::size_t> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return staging_.clear_included(branches_.head());
  });
}

// Commits

auto Repository::commit(std::string_view message) -> Result<std::string> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    const Branch &head = branches_.head_branch();
    access_.require(actor_.email, consts::kPermPush,
                    "commit on branch '" + head.name + "'");
    if (!staging_.has_included(head.name)) {
      throw Error(ErrorCode::EmptyCommit,
                  "nothing selected to commit on branch '" + head.name + "'");
    }

    Commit c{};
    c.parent    = head.tip;
    c.author    = actor_.email;
    c.timestamp = options_.clock();
    c.branch    = head.name;
    c.message   = std::string(message);
    for (const auto &e : staging_.list(head.name)) {
      if (e.included) c.changes.push_back(FileChange{.path = e.path, .kind = e.kind});
    }

    const std::string branch = head.name;
    const Commit &stored = graph_.append(std::move(c));
    branches_.set_tip(branch, stored.id);
    staging_.consume_included(branch);
    return stored.id;
  });
}

auto Repository::status() const -> Result<StatusReport> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    const Branch &head = branches_.head_branch();
    return StatusReport{.head = head.name, .tip = head.tip, .staged = staging_.list(head.name)};
  });
}

auto Repository::log(const std::optional<std::string> &branch) const
    -> Result<std::vector<Commit>> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    std::vector<Commit> out;
    if (branch) {
      for (const Commit &c : graph_.lineage(branches_.get(*branch).tip)) out.push_back(c);
      return out;
    }
    std::vector<std::string> tips;
    for (const auto &b : branches_.list()) {
      if (b.tip) tips.push_back(*b.tip);
    }
    for (const Commit *c : graph_.reachable(tips)) out.push_back(*c);
    return out;
  });
}

auto Repository::merge(std::string_view source, std::string_view destination)
    -> Result<MergeResult> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return merge_branches(merge_context(), source, destination, actor_.email,
                          options_.clock());
  });
}

// Contributors

auto Repository::list_contributors() const -> Result<std::vector<Contributor>> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return contributors_.list();
  });
}

auto Repository::add_contributor(const std::string &name, std::string_view label)
    -> Result<bool> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return contributors_.add(name, label);
  });
}

auto Repository::remove_contributor(std::string_view name) -> Result<void> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    contributors_.remove(name);
  });
}

auto Repository::find_contributor(std::string_view name) const
    -> Result<std::optional<Contributor>> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return contributors_.find(name);
  });
}

// Roles

auto Repository::role_add(std::string_view email, std::string_view role,
                          const std::vector<std::string> &permissions) -> Result<RoleRecord> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    access_.require(actor_.email, consts::kPermAdmin, "manage roles");
    access_.grant_role(email, role, permissions);
    return *access_.show(email);
  });
}

auto Repository::role_update(std::string_view email, std::string_view role,
                             const std::vector<std::string> &permissions)
    -> Result<RoleRecord> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    access_.require(actor_.email, consts::kPermAdmin, "manage roles");
    return access_.update_role(email, role, permissions);
  });
}

auto Repository::role_check(std::string_view email, std::string_view permission) const
    -> Result<bool> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return access_.check(email, permission);
  });
}

auto Repository::role_remove(std::string_view email) -> Result<void> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    access_.require(actor_.email, consts::kPermAdmin, "manage roles");
    access_.revoke(email);
  });
}

auto Repository::role_show(std::string_view email) const -> Result<std::optional<RoleRecord>> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return access_.show(email);
  });
}

auto Repository::role_list() const -> Result<std::vector<RoleRecord>> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return access_.list();
  });
}

// Pull requests

auto Repository::pr_create(std::string_view source, std::string_view destination)
    -> Result<PullRequest> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return prs_.create(branches_, source, destination, actor_.email, options_.clock());
  });
}

auto Repository::pr_review(std::uint64_t id, std::string_view comment) -> Result<PullRequest> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return prs_.review(id, actor_.email, comment, options_.clock());
  });
}

auto Repository::pr_status() const -> Result<PrSummary> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return prs_.summary();
  });
}

auto Repository::pr_show(std::uint64_t id) const -> Result<std::optional<PullRequest>> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return prs_.find(id);
  });
}

auto Repository::pr_tag(std::uint64_t id, std::string_view label) -> Result<PullRequest> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return prs_.tag(id, label);
  });
}

auto Repository::pr_approve(std::uint64_t id) -> Result<PullRequest> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return prs_.approve(id, merge_context(), actor_.email, options_.clock());
  });
}

auto Repository::pr_reject(std::uint64_t id, std::string_view reason) -> Result<PullRequest> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return prs_.reject(id, actor_.email, reason, options_.clock());
  });
}

auto Repository::pr_list() const -> Result<PrListing> {
  std::shared_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return prs_.list();
  });
}

auto Repository::pr_next() -> Result<std::optional<PullRequest>> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return prs_.next();
  });
}

auto Repository::pr_clear() -> Result<std::size_t> {
  std::unique_lock lock(mutex_);
  return capture([&] {
    require_initialized();
    return prs_.clear();
  });
}

// Persistence

auto Repository::snapshot() const -> RepositoryState {
  std::shared_lock lock(mutex_);
  RepositoryState s{};
  s.name     = name_;
  s.head     = branches_.head();
  s.branches = branches_.list();
  s.commits.assign(graph_.commits().begin(), graph_.commits().end());
  for (const auto &b : staging_.branches()) s.staging.emplace(b, staging_.list(b));
  s.contributors = contributors_.list();
  s.roles        = access_.list();
  auto prs       = prs_.list();
  s.active_prs   = std::move(prs.active);
  s.closed_prs   = std::move(prs.closed);
  s.last_pr_id   = prs_.last_id();
  return s;
}

auto Repository::restore(RepositoryState state) -> Result<void> {
  return capture([&] {
    if (state.name.empty()) {
      throw Error(ErrorCode::StateCorrupt, "repository name missing from state");
    }

    BranchStore branches;
    branches.restore(std::move(state.branches), std::move(state.head));

    CommitGraph graph;
    for (auto &c : state.commits) graph.restore(std::move(c));
    for (const auto &b : branches.list()) {
      if (b.tip && !graph.contains(*b.tip)) {
        throw Error(ErrorCode::StateCorrupt,
                    "branch '" + b.name + "' points at unknown commit " + *b.tip);
      }
    }

    for (const auto &[branch, _] : state.staging) {
      if (!branches.contains(branch)) {
        throw Error(ErrorCode::StateCorrupt, "staged entries for unknown branch '" + branch + "'");
      }
    }
    StagingArea staging;
    staging.restore(std::move(state.staging));

    AccessControl access;
    ContributorRegistry contributors;
    try {
      for (auto &r : state.roles) access.restore(std::move(r));
      for (const auto &c : state.contributors) contributors.add(c.name, c.label);
    } catch (const Error &e) {
      throw Error(ErrorCode::StateCorrupt, e.what());
    }

    PullRequestQueue prs;
    prs.restore(std::move(state.active_prs), std::move(state.closed_prs), state.last_pr_id);

    std::unique_lock lock(mutex_);
    name_         = std::move(state.name);
    branches_     = std::move(branches);
    graph_        = std::move(graph);
    staging_      = std::move(staging);
    access_       = std::move(access);
    contributors_ = std::move(contributors);
    prs_          = std::move(prs);
  });
}

} // namespace revhub
