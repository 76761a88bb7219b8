#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/auth/role_policy.hpp"
#include "internal/core/review_engine.hpp"
#include "internal/db/api/repository.hpp"

namespace bounty::core {

struct ReconcileReport {
  std::vector<std::string> stranded_submission_ids;
  std::vector<std::string> orphan_earning_ids;
  std::vector<std::string> drifted_request_ids;
  uint64_t                 repaired = 0;
};

/*
  Sweep for acceptances that died halfway.

  Per request, drift = counters - totals over accepted submissions.
  Earnings whose submission is still awaiting review are classified:

    drift == sum/count of those earnings -> stranded (crash after step 6)
    drift == 0                           -> orphans  (compensation lost)
    anything else                        -> drifted, report only

  Requests with an earning younger than the grace period are skipped;
  that acceptance may still be running.
*/
class Reconciler {
 public:
  Reconciler(std::shared_ptr<db::Repository> repository, std::shared_ptr<ReviewEngine> engine, auth::HasRoleFn has_role);

  ReconcileReport Reconcile(uint64_t grace_period_ms, bool repair, const std::string& actor);

 private:
  // Returns how many orphans were deleted: all of them or none.
  std::size_t DeleteOrphans(const db::model::RequestRecord& request, const std::vector<const db::model::EarningRecord*>& orphans);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<ReviewEngine>   engine_;
  auth::HasRoleFn                 has_role_;
};

} // namespace bounty::core
