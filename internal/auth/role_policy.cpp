#include "role_policy.hpp"

#include <algorithm>
#include <cctype>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace bounty::auth {

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

RolePolicy::RolePolicy(std::unordered_map<std::string, AdminRole> roles) {
  std::unordered_map<std::string, AdminRole> normalized;
  for (auto& [id, role] : roles) normalized.emplace(Lower(id), role);
  roles_ = std::make_shared<const std::unordered_map<std::string, AdminRole>>(std::move(normalized));
}

RolePolicy RolePolicy::FromConfig(const bounty::runtime::config::RuntimeConfig& config) {
  std::unordered_map<std::string, AdminRole> roles;
  for (const auto& admin : config.admins()) {
    roles[admin.id()] = admin.role();
  }
  return RolePolicy(std::move(roles));
}

std::optional<AdminRole> RolePolicy::RoleOf(const std::string& actor) const {
  auto it = roles_->find(Lower(actor));
  if (it == roles_->end()) return std::nullopt;
  return it->second;
}

bool RolePolicy::HasRole(const std::string& actor, AdminRole min_role) const {
  auto role = RoleOf(actor);
  return role.has_value() && RoleSatisfies(*role, min_role);
}

HasRoleFn RolePolicy::AsPredicate() const {
  RolePolicy copy = *this;
  return [copy](const std::string& actor, AdminRole min_role) { return copy.HasRole(actor, min_role); };
}

void RequireRole(const HasRoleFn& has_role, const std::string& actor, AdminRole min_role, const std::string& operation) {
  if (actor.empty()) {
    throw util::PermissionDenied(operation + ": no admin identity supplied");
  }
  if (!has_role || !has_role(actor, min_role)) {
    throw util::PermissionDenied(operation + ": requires " + std::string(ToString(min_role)) + " role");
  }
}

std::string_view ToString(AdminRole role) {
  switch (role) {
    case bounty::ledger::v1::ADMIN_ROLE_REVIEWER:
      return "reviewer";
    case bounty::ledger::v1::ADMIN_ROLE_ADMIN:
      return "admin";
    case bounty::ledger::v1::ADMIN_ROLE_SUPER_ADMIN:
      return "super_admin";
    default:
      return "unspecified";
  }
}

} // namespace bounty::auth
