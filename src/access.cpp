#include "revhub/access.hpp"

#include "revhub/error.hpp"
#include "revhub/util.hpp"

#include <algorithm>

namespace {

using revhub::Error;
using revhub::ErrorCode;
using revhub::PermissionSet;

[[nodiscard]] auto allowed_for(std::string_view role) -> const PermissionSet & {
  const auto &catalogue = revhub::role_catalogue();
  const auto it = catalogue.find(role);
  if (it == catalogue.end()) {
    std::vector<std::string> names;
    for (const auto &[name, _] : catalogue) names.push_back(name);
    throw Error(ErrorCode::InvalidRole, "invalid role '" + std::string(role) +
                                            "' (valid roles: " +
                                            revhub::strutil::join(names, ", ") + ")");
  }
  return it->second;
}

void validate_permissions(std::string_view role, const PermissionSet &allowed,
                          const std::vector<std::string> &requested) {
  std::vector<std::string> invalid;
  for (const auto &p : requested) {
    if (allowed.count(p) == 0U) invalid.push_back(p);
  }
  if (!invalid.empty()) {
    const std::vector<std::string> ok(allowed.begin(), allowed.end());
    throw Error(ErrorCode::InvalidPermission,
                "invalid permissions for role '" + std::string(role) +
                    "': " + revhub::strutil::join(invalid, ", ") +
                    " (allowed: " + revhub::strutil::join(ok, ", ", "none") + ")");
  }
}

} // namespace

namespace revhub {

// Contributors

bool ContributorRegistry::add(const std::string &name, std::string_view label) {
  if (name.empty()) {
    throw Error(ErrorCode::InvalidArgument, "contributor name must not be empty");
  }
  const auto [it, inserted] = labels_.insert_or_assign(name, std::string(label));
  return inserted;
}

void ContributorRegistry::remove(std::string_view name) {
  const auto it = labels_.find(name);
  if (it == labels_.end()) {
    throw Error(ErrorCode::CollaboratorNotFound,
                "contributor '" + std::string(name) + "' not found");
  }
  labels_.erase(it);
}

auto ContributorRegistry::find(std::string_view name) const -> std::optional<Contributor> {
  const auto it = labels_.find(name);
  if (it == labels_.end()) return std::nullopt;
  return Contributor{.name = it->first, .label = it->second};
}

auto ContributorRegistry::list() const -> std::vector<Contributor> {
  std::vector<Contributor> out;
  out.reserve(labels_.size());
  for (const auto &[name, label] : labels_) {
    out.push_back(Contributor{.name = name, .label = label});
  }
  return out;
}

// Roles

auto role_catalogue() -> const std::map<std::string, PermissionSet, std::less<>> & {
  static const std::map<std::string, PermissionSet, std::less<>> catalogue{
      {std::string(consts::kRoleAdmin),
       {std::string(consts::kPermPull), std::string(consts::kPermPush),
        std::string(consts::kPermMerge), std::string(consts::kPermAdmin)}},
      {std::string(consts::kRoleMaintainer),
       {std::string(consts::kPermPush), std::string(consts::kPermMerge)}},
      {std::string(consts::kRoleDeveloper), {std::string(consts::kPermPush)}},
      {std::string(consts::kRoleGuest), {std::string(consts::kPermPull)}},
  };
  return catalogue;
}

void AccessControl::grant_role(std::string_view email, std::string_view role,
                               const std::vector<std::string> &permissions) {
  const std::string key  = strutil::to_lower(email);
  const std::string name = strutil::to_lower(role);
  if (key.empty()) {
    throw Error(ErrorCode::InvalidArgument, "email must not be empty");
  }
  const auto &allowed = allowed_for(name);
  validate_permissions(name, allowed, permissions);

  RoleRecord rec{.email = key, .role = name, .permissions = {}};
  rec.permissions.insert(permissions.begin(), permissions.end());
  records_.insert_or_assign(key, std::move(rec));
}

auto AccessControl::update_role(std::string_view email, std::string_view role,
                                const std::vector<std::string> &add_permissions) -> RoleRecord {
  const std::string key = strutil::to_lower(email);
  const auto it = records_.find(key);
  if (it == records_.end()) {
    throw Error(ErrorCode::CollaboratorNotFound, "user '" + key + "' not found");
  }
  const std::string name = strutil::to_lower(role);
  const auto &allowed = allowed_for(name);
  validate_permissions(name, allowed, add_permissions);

  RoleRecord &rec = it->second;
  rec.role = name;
  rec.permissions.insert(add_permissions.begin(), add_permissions.end());
  return rec;
}

void AccessControl::restore(RoleRecord rec) {
  rec.email = strutil::to_lower(rec.email);
  rec.role  = strutil::to_lower(rec.role);
  if (rec.email.empty()) {
    throw Error(ErrorCode::StateCorrupt, "role record without an email");
  }
  const auto &catalogue = role_catalogue();
  if (!catalogue.contains(rec.role)) {
    throw Error(ErrorCode::StateCorrupt, "unknown role '" + rec.role + "' for " + rec.email);
  }
  const auto &known = catalogue.at(std::string(consts::kRoleAdmin));
  for (const auto &p : rec.permissions) {
    if (!known.contains(p)) {
      throw Error(ErrorCode::StateCorrupt, "unknown permission '" + p + "' for " + rec.email);
    }
  }
  std::string key = rec.email;
  records_.insert_or_assign(std::move(key), std::move(rec));
}

void AccessControl::revoke(std::string_view email) {
  const std::string key = strutil::to_lower(email);
  if (records_.erase(key) == 0U) {
    throw Error(ErrorCode::CollaboratorNotFound, "user '" + key + "' not found");
  }
}

bool AccessControl::check(std::string_view email, std::string_view permission) const {
  const auto it = records_.find(strutil::to_lower(email));
  return it != records_.end() && it->second.permissions.contains(permission);
}

void AccessControl::require(std::string_view email, std::string_view permission,
                            std::string_view action) const {
  if (!check(email, permission)) {
    throw Error(ErrorCode::PermissionDenied, "'" + std::string(email) + "' lacks '" +
                                                 std::string(permission) +
                                                 "' permission to " + std::string(action));
  }
}

auto AccessControl::show(std::string_view email) const -> std::optional<RoleRecord> {
  const auto it = records_.find(strutil::to_lower(email));
  if (it == records_.end()) return std::nullopt;
  return it->second;
}

auto AccessControl::list() const -> std::vector<RoleRecord> {
  std::vector<RoleRecord> out;
  out.reserve(records_.size());
  for (const auto &[_, rec] : records_) out.push_back(rec);
  return out;
}

} // namespace revhub
