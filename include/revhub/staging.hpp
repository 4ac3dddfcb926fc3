#pragma once
#include <cstdint>
#include <ctime>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace revhub {

enum class ChangeKind : std::uint8_t { Added, Modified, Deleted };

// 'A' | 'M' | 'D'
auto change_kind_code(ChangeKind kind) -> char;
auto change_kind_from_code(char code) -> std::optional<ChangeKind>;

struct StagingEntry {
  std::string path;  // repo-relative
  ChangeKind kind;
  bool included = false;
  std::time_t staged_at = 0;
};

// Pending changes per branch, in insertion order.
class StagingArea {
public:
  // Insert `path`, or update the kind of an existing entry in place (its
  // position and included flag are kept). Returns true on insert.
  bool add(const std::string &branch, const std::string &path, ChangeKind kind,
           std::time_t now);

  [[nodiscard]] auto list(std::string_view branch) const -> std::vector<StagingEntry>;

  // Flip the included flag and return its new value.
  // Throws Error(StagingEntryNotFound) if `path` was never added on `branch`.
  bool toggle(std::string_view branch, std::string_view path);

  [[nodiscard]] bool has_included(std::string_view branch) const;

  // Remove and return the included entries, in insertion order.
  auto consume_included(std::string_view branch) -> std::vector<StagingEntry>;

  // Both return the number of entries dropped.
  std::size_t clear(std::string_view branch);
  std::size_t clear_included(std::string_view branch);

  [[nodiscard]] auto branches() const -> std::vector<std::string>;

  // Replace every branch's entries (state restore). Throws Error(StateCorrupt)
  // on an empty or repeated path.
  void restore(std::map<std::string, std::vector<StagingEntry>, std::less<>> entries);

private:
  std::map<std::string, std::vector<StagingEntry>, std::less<>> entries_;
};

} // namespace revhub
