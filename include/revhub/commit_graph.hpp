#pragma once
#include "revhub/staging.hpp"

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <deque>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace revhub {

// Merges stay single-parent; Merge marks the commit and keeps the source tip.
enum class CommitKind : std::uint8_t { Root, Normal, Merge };

auto commit_kind_name(CommitKind kind) -> std::string_view;

struct FileChange {
  std::string path;
  ChangeKind kind;
};

struct Commit {
  std::string id;                         // consts::kCommitIdLen hex digits
  std::optional<std::string> parent;      // nullopt for a root commit
  std::string author;
  std::time_t timestamp = 0;
  std::string branch;                     // branch of first creation; not hashed, so a
                                          // reused commit keeps its original branch
  std::string message;
  std::vector<FileChange> changes;        // ordered
  CommitKind kind = CommitKind::Normal;
  std::optional<std::string> merged_from; // source tip, Merge commits only

  [[nodiscard]] auto paths() const -> std::vector<std::string>;
};

// Latest change to a path along one lineage.
struct PathState {
  ChangeKind kind;
  std::string commit_id;
};

class CommitGraph {
public:
  // Lazy walk from a tip along parent links. Restartable: every begin()
  // starts again from the tip.
  class Lineage {
  public:
    class iterator {
    public:
      using iterator_category = std::forward_iterator_tag;
      using value_type        = Commit;
      using difference_type   = std::ptrdiff_t;
      using pointer           = const Commit *;
      using reference         = const Commit &;

      iterator() = default;
      iterator(const CommitGraph *graph, const Commit *cur) : graph_(graph), cur_(cur) {}

      reference operator*() const { return *cur_; }
      pointer operator->() const { return cur_; }
      iterator &operator++();
      iterator operator++(int) {
        iterator tmp = *this;
        ++*this;
        return tmp;
      }
      bool operator==(const iterator &other) const { return cur_ == other.cur_; }

    private:
      const CommitGraph *graph_ = nullptr;
      const Commit *cur_ = nullptr;
    };

    Lineage(const CommitGraph *graph, const Commit *tip) : graph_(graph), tip_(tip) {}

    [[nodiscard]] iterator begin() const { return iterator{graph_, tip_}; }
    [[nodiscard]] iterator end() const { return iterator{graph_, nullptr}; }
    [[nodiscard]] bool empty() const { return tip_ == nullptr; }

  private:
    const CommitGraph *graph_;
    const Commit *tip_;
  };

  // Fill in `id` (and `kind` Root when there is no parent, unless Merge) and
  // append. Returns the stored commit; an identical commit already in the graph
  // is reused rather than duplicated, keeping its original `branch`.
  auto append(Commit commit) -> const Commit &;

  // Append a commit whose id was computed elsewhere (state restore).
  // Throws Error(StateCorrupt) if the id does not match the content or the
  // parent is unknown.
  auto restore(Commit commit) -> const Commit &;

  [[nodiscard]] auto find(std::string_view id) const -> const Commit *;
  [[nodiscard]] bool contains(std::string_view id) const { return find(id) != nullptr; }

  [[nodiscard]] auto lineage(const std::optional<std::string> &tip) const -> Lineage;

  // Commits reachable from any of `tips`, most recent first; equal timestamps
  // are ordered by insertion (later first).
  [[nodiscard]] auto reachable(const std::vector<std::string> &tips) const
      -> std::vector<const Commit *>;

  // Ids of every commit reachable from `tip` through parent links and the
  // merged_from provenance of Merge commits. `tip` itself included.
  [[nodiscard]] auto ancestry(const std::optional<std::string> &tip) const
      -> std::set<std::string>;

  // path -> latest change, folded along the lineage of `tip`.
  [[nodiscard]] auto fold(const std::optional<std::string> &tip) const
      -> std::map<std::string, PathState>;

  // Paths present after the lineage of `tip` (latest change not a deletion).
  [[nodiscard]] bool tracks(const std::optional<std::string> &tip, std::string_view path) const;

  [[nodiscard]] std::size_t size() const { return commits_.size(); }

  // Insertion order.
  [[nodiscard]] const std::deque<Commit> &commits() const { return commits_; }

private:
  [[nodiscard]] std::size_t sequence_of(const Commit &c) const;

  std::deque<Commit> commits_; // append-only; element addresses stay valid
  std::unordered_map<std::string, std::size_t> by_id_;
};

} // namespace revhub
