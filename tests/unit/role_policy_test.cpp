#include <cassert>
#include <iostream>
#include <cctype>
#include <string>

#include "internal/auth/role_policy.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using namespace bounty::testing;
using bounty::auth::RequireRole;
using bounty::auth::RoleSatisfies;

void TestHierarchy() {
  assert(RoleSatisfies(ADMIN_ROLE_SUPER_ADMIN, ADMIN_ROLE_REVIEWER));
  assert(RoleSatisfies(ADMIN_ROLE_ADMIN, ADMIN_ROLE_ADMIN));
  assert(!RoleSatisfies(ADMIN_ROLE_REVIEWER, ADMIN_ROLE_ADMIN));
  assert(!RoleSatisfies(ADMIN_ROLE_UNSPECIFIED, ADMIN_ROLE_REVIEWER));
}

void TestPolicyLookup() {
  const auto policy = TestRoles();
  assert(policy.RoleOf(kAdmin) == ADMIN_ROLE_ADMIN);
  assert(!policy.RoleOf(kStranger).has_value());
  assert(policy.HasRole(kSuperAdmin, ADMIN_ROLE_ADMIN));
  assert(!policy.HasRole(kReviewer, ADMIN_ROLE_ADMIN));

  std::string upper = kAdmin;
  for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  assert(policy.HasRole(upper, ADMIN_ROLE_ADMIN));
}

void TestPredicateOutlivesPolicy() {
  bounty::auth::HasRoleFn predicate;
  {
    const auto policy = TestRoles();
    predicate         = policy.AsPredicate();
  }
  assert(predicate(kReviewer, ADMIN_ROLE_REVIEWER));
  assert(!predicate(kReviewer, ADMIN_ROLE_SUPER_ADMIN));
}

void TestRequireRole() {
  const auto predicate = TestRoles().AsPredicate();
  RequireRole(predicate, kAdmin, ADMIN_ROLE_REVIEWER, "read");
  assert(Throws<bounty::util::PermissionDenied>([&] { RequireRole(predicate, kReviewer, ADMIN_ROLE_ADMIN, "accept"); }));
  assert(Throws<bounty::util::PermissionDenied>([&] { RequireRole(predicate, "", ADMIN_ROLE_REVIEWER, "read"); }));
  assert(Throws<bounty::util::PermissionDenied>([&] { RequireRole(nullptr, kAdmin, ADMIN_ROLE_REVIEWER, "read"); }));
}

} // namespace

int main() {
  TestHierarchy();
  TestPolicyLookup();
  TestPredicateOutlivesPolicy();
  TestRequireRole();

  std::cout << "bounty_ledger_unit_role_policy: pass\n";
  return 0;
}
