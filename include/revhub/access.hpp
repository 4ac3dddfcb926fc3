#pragma once
#include "revhub/consts.hpp"

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace revhub {

struct Contributor {
  std::string name;  // unique, case-sensitive
  std::string label; // free-form, "Contributor" unless given
};

// Named contributors, kept in alphabetical order.
class ContributorRegistry {
public:
  // Returns true if `name` was inserted, false if an existing entry was relabelled.
  bool add(const std::string &name,
           std::string_view label = consts::kDefaultContributorLabel);

  // Throws Error(CollaboratorNotFound) if absent.
  void remove(std::string_view name);

  // Exact, case-sensitive lookup. Absence is a normal outcome.
  [[nodiscard]] auto find(std::string_view name) const -> std::optional<Contributor>;

  [[nodiscard]] auto list() const -> std::vector<Contributor>;

private:
  std::map<std::string, std::string, std::less<>> labels_;
};

using PermissionSet = std::set<std::string, std::less<>>;

struct RoleRecord {
  std::string email; // normalized to lower case
  std::string role;
  PermissionSet permissions;
};

// role -> permissions that role may be granted.
auto role_catalogue() -> const std::map<std::string, PermissionSet, std::less<>> &;

class AccessControl {
public:
  // Create or replace the record for `email`. Every permission must belong to
  // the role's catalogue entry.
  void grant_role(std::string_view email, std::string_view role,
                  const std::vector<std::string> &permissions);

  // Switch the role and add permissions. Permissions already held are never
  // removed. Throws Error(CollaboratorNotFound) if absent.
  auto update_role(std::string_view email, std::string_view role,
                   const std::vector<std::string> &add_permissions) -> RoleRecord;

  // Reinstate a saved record. Permissions carried over by update_role may fall
  // outside the role's catalogue entry, so only names are checked here.
  // Throws Error(StateCorrupt) for an unknown role or permission.
  void restore(RoleRecord rec);

  // Throws Error(CollaboratorNotFound) if absent.
  void revoke(std::string_view email);

  // Unknown emails hold no permissions.
  [[nodiscard]] bool check(std::string_view email, std::string_view permission) const;

  // Throws Error(PermissionDenied) naming `action` when check() fails.
  void require(std::string_view email, std::string_view permission,
               std::string_view action) const;

  [[nodiscard]] auto show(std::string_view email) const -> std::optional<RoleRecord>;

  // Ordered by email.
  [[nodiscard]] auto list() const -> std::vector<RoleRecord>;

private:
  std::map<std::string, RoleRecord, std::less<>> records_;
};

} // namespace revhub
