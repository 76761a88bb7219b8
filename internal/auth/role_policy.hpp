#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "bounty/ledger/v1.hpp"

namespace bounty::runtime::config {
class RuntimeConfig;
}

namespace bounty::auth {

using bounty::ledger::v1::AdminRole;

// HasRole(actor, min_role): true when actor's role ranks at or above min_role.
using HasRoleFn = std::function<bool(const std::string& actor, AdminRole min_role)>;

// reviewer(1) < admin(2) < super_admin(3)
constexpr bool RoleSatisfies(AdminRole held, AdminRole required) {
  return held != bounty::ledger::v1::ADMIN_ROLE_UNSPECIFIED && static_cast<int>(held) >= static_cast<int>(required);
}

/*
  Static admin table.

  Built from the `admins:` list in the runtime config. Unknown actors
  hold no role and fail every check.
*/
class RolePolicy {
 public:
  RolePolicy() = default;
  explicit RolePolicy(std::unordered_map<std::string, AdminRole> roles);

  static RolePolicy FromConfig(const bounty::runtime::config::RuntimeConfig& config);

  std::optional<AdminRole> RoleOf(const std::string& actor) const;
  bool                     HasRole(const std::string& actor, AdminRole min_role) const;

  // Predicate sharing this table; outlives the policy object.
  HasRoleFn AsPredicate() const;

 private:
  std::shared_ptr<const std::unordered_map<std::string, AdminRole>> roles_ =
      std::make_shared<const std::unordered_map<std::string, AdminRole>>();
};

// Throws util::PermissionDenied naming `operation` when the check fails.
void RequireRole(const HasRoleFn& has_role, const std::string& actor, AdminRole min_role, const std::string& operation);

std::string_view ToString(AdminRole role);

} // namespace bounty::auth
