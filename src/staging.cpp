#include "revhub/staging.hpp"

#include "revhub/error.hpp"

#include <algorithm>
#include <set>

namespace revhub {

char change_kind_code(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::Added:    return 'A';
  case ChangeKind::Modified: return 'M';
  case ChangeKind::Deleted:  return 'D';
  }
  return '?';
}

std::optional<ChangeKind> change_kind_from_code(char code) {
  switch (code) {
  case 'A': return ChangeKind::Added;
  case 'M': return ChangeKind::Modified;
  case 'D': return ChangeKind::Deleted;
  default:  return std::nullopt;
  }
}

bool StagingArea::add(const std::string &branch, const std::string &path, ChangeKind kind,
                      std::time_t now) {
  if (path.empty()) {
    throw Error(ErrorCode::InvalidArgument, "cannot stage an empty path");
  }
  auto &list = entries_[branch];
  const auto it = std::ranges::find(list, path, &StagingEntry::path);
  if (it != list.end()) {
    it->kind = kind;
    it->staged_at = now;
    return false;
  }
  list.push_back(StagingEntry{.path = path, .kind = kind, .included = false, .staged_at = now});
  return true;
}

auto StagingArea::list(std::string_view branch) const -> std::vector<StagingEntry> {
  const auto it = entries_.find(branch);
  return it == entries_.end() ? std::vector<StagingEntry>{} : it->second;
}

bool StagingArea::toggle(std::string_view branch, std::string_view path) {
  const auto it = entries_.find(branch);
  if (it != entries_.end()) {
    const auto e = std::ranges::find(it->second, path, &StagingEntry::path);
    if (e != it->second.end()) {
      e->included = !e->included;
      return e->included;
    }
  }
  throw Error(ErrorCode::StagingEntryNotFound,
              "'" + std::string(path) + "' is not staged on branch '" + std::string(branch) +
                  "'");
}

bool StagingArea::has_included(std::string_view branch) const {
  const auto it = entries_.find(branch);
  return it != entries_.end() && std::ranges::any_of(it->second, &StagingEntry::included);
}

auto StagingArea::consume_included(std::string_view branch) -> std::vector<StagingEntry> {
  std::vector<StagingEntry> taken;
  const auto it = entries_.find(branch);
  if (it == entries_.end()) return taken;

  std::vector<StagingEntry> kept;
  for (auto &e : it->second) {
    (e.included ? taken : kept).push_back(std::move(e));
  }
  it->second = std::move(kept);
  if (it->second.empty()) entries_.erase(it);
  return taken;
}

std::size_t StagingArea::clear(std::string_view branch) {
  const auto it = entries_.find(branch);
  if (it == entries_.end()) return 0;
  const std::size_t n = it->second.size();
  entries_.erase(it);
  return n;
}

std::size_t StagingArea::clear_included(std::string_view branch) {
  return consume_included(branch).size();
}

auto StagingArea::branches() const -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto &[name, _] : entries_) out.push_back(name);
  return out;
}

void StagingArea::restore(std::map<std::string, std::vector<StagingEntry>, std::less<>> entries) {
  for (const auto &[branch, list] : entries) {
    std::set<std::string_view> seen;
    for (const auto &e : list) {
      if (e.path.empty() || !seen.insert(e.path).second) {
        throw Error(ErrorCode::StateCorrupt,
                    "bad staging entry '" + e.path + "' on branch '" + branch + "'");
      }
    }
  }
  std::erase_if(entries, [](const auto &kv) { return kv.second.empty(); });
  entries_ = std::move(entries);
}

} // namespace revhub
