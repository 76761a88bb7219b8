#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bounty/ledger/v1.hpp"
#include "internal/auth/role_policy.hpp"
#include "internal/core/payout_calculator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/notifier.hpp"

namespace bounty::core {

struct ReviewDecision {
  std::string                      submission_id;
  bounty::ledger::v1::ReviewAction action = bounty::ledger::v1::REVIEW_ACTION_UNSPECIFIED;
  std::string                      feedback;
  bool                             award_quality_bonus = false;
};

struct ReviewOutcome {
  db::model::SubmissionRecord             submission;
  std::optional<db::model::EarningRecord> earning; // accept only
  std::optional<PayoutBreakdown>          payout;  // accept only
};

struct ReviewEngineOptions {
  uint32_t                  compensation_max_attempts = 3;
  std::chrono::milliseconds compensation_backoff{50};
};

/*
  Submission review.

  The store only promises per-statement atomicity, so an acceptance is
  a chain of short transactions:

    1. read submission, request, image count
    2. compute payout
    3. insert provisional earning (claims the submission)
    4. new counters = old + payout / +1
    5. over budget          -> delete earning, BudgetExceeded
    6. CAS request counters on (version, spent, fulfilled)
    7. CAS lost             -> delete earning, ConcurrentModification
    8. mark submission accepted, notify

  Step 6 is the only serialization point between reviewers. The
  earning delete in 5/7 is idempotent and retried on transient store
  failures; step 8 is re-entrant on (submission, earning).
  ConcurrentModification is never retried here.
*/
class ReviewEngine {
 public:
  ReviewEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::Notifier> notifier, auth::HasRoleFn has_role,
               ReviewEngineOptions options = {});

  ReviewOutcome Review(const ReviewDecision& decision, const std::string& actor);

  // Oldest first.
  std::vector<db::model::SubmissionRecord> ListPending(std::size_t limit, const std::string& actor);

  /*
    Step 8 on its own: marks the submission accepted against an earning
    whose counters are already applied. Succeeds without change when
    already done. Used by Review() and by reconciliation repair.
  */
  db::model::SubmissionRecord CompleteAcceptance(const db::model::EarningRecord& earning, const std::string& reviewed_by,
                                                 const std::string& feedback);

 private:
  ReviewOutcome Accept(const ReviewDecision& decision, const std::string& actor);
  ReviewOutcome Decline(const ReviewDecision& decision, const std::string& actor);

  // Returns false when every attempt failed; the earning is then stranded.
  bool Compensate(const db::model::EarningRecord& earning, const char* reason);

  void NotifyContributor(const notify::Notification& notification);

  std::shared_ptr<db::Repository>   repository_;
  std::shared_ptr<notify::Notifier> notifier_;
  auth::HasRoleFn                   has_role_;
  ReviewEngineOptions               options_;
};

} // namespace bounty::core
