#pragma once
#include <cstddef>
#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace revhub {

struct Branch {
  std::string name;
  std::optional<std::string> tip; // nullopt until the first commit
  std::time_t created = 0;
  std::string forked_from;        // empty for the default branch
};

// Branch pointers plus HEAD. The default branch always exists.
class BranchStore {
public:
  explicit BranchStore(std::time_t created = 0);

  // New branch starting at the tip of `from`.
  // Throws Error(DuplicateBranch) / Error(BranchNotFound).
  auto create(std::string_view name, std::string_view from, std::time_t now) -> const Branch &;

  // Throws Error(ActiveBranch) for HEAD, Error(BranchNotFound) if absent,
  // Error(ProtectedBranch) for the default branch or a branch others forked from.
  void remove(std::string_view name);

  // Throws Error(BranchNotFound).
  void checkout(std::string_view name);

  [[nodiscard]] bool contains(std::string_view name) const;

  // Throws Error(BranchNotFound).
  [[nodiscard]] auto get(std::string_view name) const -> const Branch &;

  void set_tip(std::string_view name, const std::string &commit_id);

  [[nodiscard]] const std::string &head() const { return head_; }
  [[nodiscard]] auto head_branch() const -> const Branch & { return get(head_); }

  // Sorted by name.
  [[nodiscard]] auto list() const -> std::vector<Branch>;

  // Fork tree in pre-order: (name, depth), children sorted by name.
  [[nodiscard]] auto tree() const -> std::vector<std::pair<std::string, std::size_t>>;

  // Replace every branch and HEAD (state restore).
  // Throws Error(StateCorrupt) if HEAD or a fork parent is missing.
  void restore(std::vector<Branch> branches, std::string head);

private:
  std::map<std::string, Branch, std::less<>> branches_;
  std::string head_;
};

} // namespace revhub
