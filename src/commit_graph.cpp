#include "revhub/commit_graph.hpp"

#include "revhub/error.hpp"
#include "revhub/hash.hpp"

#include <algorithm>
#include <set>

namespace revhub {

auto commit_kind_name(CommitKind kind) -> std::string_view {
  switch (kind) {
  case CommitKind::Root:   return "root";
  case CommitKind::Normal: return "normal";
  case CommitKind::Merge:  return "merge";
  }
  return "unknown";
}

auto Commit::paths() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(changes.size());
  for (const auto &c : changes) out.push_back(c.path);
  return out;
}

CommitGraph::Lineage::iterator &CommitGraph::Lineage::iterator::operator++() {
  cur_ = (cur_ != nullptr && cur_->parent) ? graph_->find(*cur_->parent) : nullptr;
  return *this;
}

auto CommitGraph::append(Commit commit) -> const Commit & {
  if (commit.parent && !contains(*commit.parent)) {
    throw Error(ErrorCode::InvalidArgument, "unknown parent commit " + *commit.parent);
  }
  if (!commit.parent && commit.kind != CommitKind::Merge) {
    commit.kind = CommitKind::Root;
  }
  commit.id = commit_id(commit.parent, commit.author, commit.timestamp, commit.message,
                        commit.paths());

  if (const Commit *existing = find(commit.id)) {
    return *existing;
  }
  by_id_.emplace(commit.id, commits_.size());
  commits_.push_back(std::move(commit));
  return commits_.back();
}

auto CommitGraph::restore(Commit commit) -> const Commit & {
  if (commit.parent && !contains(*commit.parent)) {
    throw Error(ErrorCode::StateCorrupt,
                "commit " + commit.id + " references unknown parent " + *commit.parent);
  }
  const std::string expected = commit_id(commit.parent, commit.author, commit.timestamp,
                                         commit.message, commit.paths());
  if (expected != commit.id) {
    throw Error(ErrorCode::StateCorrupt,
                "commit " + commit.id + " does not match its content (expected " + expected +
                    ")");
  }
  if (contains(commit.id)) {
    throw Error(ErrorCode::StateCorrupt, "duplicate commit " + commit.id);
  }
  by_id_.emplace(commit.id, commits_.size());
  commits_.push_back(std::move(commit));
  return commits_.back();
}

auto CommitGraph::find(std::string_view id) const -> const Commit * {
  const auto it = by_id_.find(std::string(id));
  return it == by_id_.end() ? nullptr : &commits_[it->second];
}

auto CommitGraph::lineage(const std::optional<std::string> &tip) const -> Lineage {
  return Lineage{this, tip ? find(*tip) : nullptr};
}

std::size_t CommitGraph::sequence_of(const Commit &c) const { return by_id_.at(c.id); }

auto CommitGraph::reachable(const std::vector<std::string> &tips) const
    -> std::vector<const Commit *> {
  std::set<std::string> seen;
  std::vector<const Commit *> out;
  for (const auto &tip : tips) {
    for (const Commit &c : lineage(tip)) {
      if (!seen.insert(c.id).second) break; // rest of this chain already collected
      out.push_back(&c);
    }
  }
  std::ranges::sort(out, [this](const Commit *a, const Commit *b) {
    if (a->timestamp != b->timestamp) return a->timestamp > b->timestamp;
    return sequence_of(*a) > sequence_of(*b);
  });
  return out;
}

auto CommitGraph::ancestry(const std::optional<std::string> &tip) const
    -> std::set<std::string> {
  std::set<std::string> seen;
  std::vector<std::string> stack;
  if (tip) stack.push_back(*tip);
  while (!stack.empty()) {
    const std::string cur = std::move(stack.back());
    stack.pop_back();
    if (!seen.insert(cur).second) continue;
    const Commit *c = find(cur);
    if (c == nullptr) continue;
    if (c->parent) stack.push_back(*c->parent);
    if (c->merged_from) stack.push_back(*c->merged_from);
  }
  return seen;
}

auto CommitGraph::fold(const std::optional<std::string> &tip) const
    -> std::map<std::string, PathState> {
  std::map<std::string, PathState> out;
  // Newest first: the first change seen for a path is its latest one.
  for (const Commit &c : lineage(tip)) {
    for (auto it = c.changes.rbegin(); it != c.changes.rend(); ++it) {
      out.try_emplace(it->path, PathState{.kind = it->kind, .commit_id = c.id});
    }
  }
  return out;
}

bool CommitGraph::tracks(const std::optional<std::string> &tip, std::string_view path) const {
  for (const Commit &c : lineage(tip)) {
    for (auto it = c.changes.rbegin(); it != c.changes.rend(); ++it) {
      if (it->path == path) return it->kind != ChangeKind::Deleted;
    }
  }
  return false;
}

} // namespace revhub
