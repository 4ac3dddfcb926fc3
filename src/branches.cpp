#include "revhub/branches.hpp"

#include "revhub/consts.hpp"
#include "revhub/error.hpp"

#include <algorithm>

namespace {

[[nodiscard]] auto not_found(std::string_view name) -> revhub::Error {
  return revhub::Error(revhub::ErrorCode::BranchNotFound,
                       "branch '" + std::string(name) + "' does not exist");
}

} // namespace

namespace revhub {

BranchStore::BranchStore(std::time_t created) : head_(consts::kDefaultBranch) {
  branches_.emplace(head_, Branch{.name = head_, .tip = std::nullopt, .created = created,
                                  .forked_from = {}});
}

auto BranchStore::create(std::string_view name, std::string_view from, std::time_t now)
    -> const Branch & {
  if (name.empty()) {
    throw Error(ErrorCode::InvalidArgument, "branch name must not be empty");
  }
  if (contains(name)) {
    throw Error(ErrorCode::DuplicateBranch, "branch '" + std::string(name) + "' already exists");
  }
  const Branch &parent = get(from);
  Branch b{.name = std::string(name), .tip = parent.tip, .created = now,
           .forked_from = parent.name};
  const auto [it, _] = branches_.emplace(b.name, std::move(b));
  return it->second;
}

void BranchStore::remove(std::string_view name) {
  const auto it = branches_.find(name);
  if (it == branches_.end()) {
    throw not_found(name);
  }
  if (name == head_) {
    throw Error(ErrorCode::ActiveBranch,
                "cannot delete the checked-out branch '" + std::string(name) + "'");
  }
  if (name == consts::kDefaultBranch) {
    throw Error(ErrorCode::ProtectedBranch,
                "cannot delete the default branch '" + std::string(name) + "'");
  }
  const bool has_children = std::ranges::any_of(
      branches_, [&](const auto &kv) { return kv.second.forked_from == name; });
  if (has_children) {
    throw Error(ErrorCode::ProtectedBranch,
                "branch '" + std::string(name) + "' has branches forked from it");
  }
  branches_.erase(it);
}

void BranchStore::checkout(std::string_view name) {
  if (!contains(name)) {
    throw not_found(name);
  }
  head_ = std::string(name);
}

bool BranchStore::contains(std::string_view name) const {
  return branches_.find(name) != branches_.end();
}

auto BranchStore::get(std::string_view name) const -> const Branch & {
  const auto it = branches_.find(name);
  if (it == branches_.end()) {
    throw not_found(name);
  }
  return it->second;
}

void BranchStore::set_tip(std::string_view name, const std::string &commit_id) {
  const auto it = branches_.find(name);
  if (it == branches_.end()) {
    throw not_found(name);
  }
  it->second.tip = commit_id;
}

auto BranchStore::list() const -> std::vector<Branch> {
  std::vector<Branch> out;
  out.reserve(branches_.size());
  for (const auto &[_, b] : branches_) out.push_back(b);
  return out;
}

auto BranchStore::tree() const -> std::vector<std::pair<std::string, std::size_t>> {
  std::vector<std::pair<std::string, std::size_t>> out;
  const auto visit = [&](const auto &self, const std::string &name, std::size_t depth) -> void {
    out.emplace_back(name, depth);
    for (const auto &[child, b] : branches_) {
      if (b.forked_from == name) self(self, child, depth + 1);
    }
  };
  for (const auto &[name, b] : branches_) {
    if (b.forked_from.empty()) visit(visit, name, 0);
  }
  return out;
}

void BranchStore::restore(std::vector<Branch> branches, std::string head) {
  std::map<std::string, Branch, std::less<>> next;
  for (auto &b : branches) {
    std::string key = b.name;
    next.insert_or_assign(std::move(key), std::move(b));
  }
  if (next.find(consts::kDefaultBranch) == next.end()) {
    throw Error(ErrorCode::StateCorrupt, "default branch missing from state");
  }
  if (next.find(head) == next.end()) {
    throw Error(ErrorCode::StateCorrupt, "HEAD names unknown branch '" + head + "'");
  }
  for (const auto &[name, b] : next) {
    if (!b.forked_from.empty() && next.find(b.forked_from) == next.end()) {
      throw Error(ErrorCode::StateCorrupt,
                  "branch '" + name + "' forked from unknown branch '" + b.forked_from + "'");
    }
  }
  branches_ = std::move(next);
  head_ = std::move(head);
}

} // namespace revhub
