#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bounty/ledger/v1.hpp"
#include "internal/auth/role_policy.hpp"
#include "internal/db/api/repository.hpp"

namespace bounty::core {

struct PayoutStats {
  int64_t  pending_cents    = 0;
  uint64_t pending_count    = 0;
  int64_t  processing_cents = 0;
  int64_t  paid_cents       = 0;
  int64_t  held_cents       = 0;
};

struct AdminStats {
  uint64_t total_requests     = 0;
  uint64_t draft_requests     = 0;
  uint64_t published_requests = 0;
  uint64_t paused_requests    = 0;
  uint64_t fulfilled_requests = 0;
  uint64_t pending_reviews    = 0;
  int64_t  budget_total_cents = 0;
  int64_t  budget_spent_cents = 0;
  uint64_t total_submissions  = 0;
};

struct EarningsPage {
  std::vector<db::model::EarningRecord> earnings;
  uint64_t                              total = 0;
};

/*
  Earnings ledger: read side plus the payout-status workflow.

  Rows are never rewritten except for status / paid_at_ms, and every
  status move is a conditional update on the legal source statuses.
*/
class EarningsLedger {
 public:
  EarningsLedger(std::shared_ptr<db::Repository> repository, auth::HasRoleFn has_role);

  PayoutStats GetPayoutStats(const std::string& actor);
  AdminStats  GetAdminStats(const std::string& actor);

  // page is 1-based; page 0 is treated as 1. page_size 0 means 50, capped at 500.
  EarningsPage ListEarnings(std::optional<bounty::ledger::v1::EarningStatus> status, uint32_t page, uint32_t page_size,
                            const std::string& actor);

  db::model::EarningRecord UpdateEarningStatus(const std::string& earning_id, bounty::ledger::v1::EarningStatus to, const std::string& actor);

 private:
  std::shared_ptr<db::Repository> repository_;
  auth::HasRoleFn                 has_role_;
};

} // namespace bounty::core
