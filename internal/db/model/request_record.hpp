#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bounty/ledger/v1.hpp"

namespace bounty::db::model {

/*
  Persistent bounty request row.

  IMPORTANT:
  - budget_spent_cents / quantity_fulfilled are a materialized aggregate
    over the request's accepted submissions.
  - version is bumped on every mutation; counter updates compare-and-swap on it.
*/

struct RequestRecord {
  std::string id;
  std::string created_by;
  std::string title;
  std::string description;

  bounty::ledger::v1::RequestStatus status = bounty::ledger::v1::REQUEST_STATUS_DRAFT;

  bounty::ledger::v1::PayType pay_type = bounty::ledger::v1::PAY_TYPE_FLAT;
  int64_t                     pay_amount_cents   = 0;
  int64_t                     speed_bonus_cents  = 0;
  std::optional<int64_t>      speed_bonus_deadline_ms;
  int64_t                     quality_bonus_cents = 0;

  int64_t budget_total_cents = 0;
  int64_t budget_spent_cents = 0;
  int64_t quantity_needed    = 0;
  int64_t quantity_fulfilled = 0;

  int64_t     published_at_ms = 0;
  std::string reviewed_by;
  int64_t     reviewed_at_ms = 0;
  int64_t     created_at_ms  = 0;
  int64_t     updated_at_ms  = 0;

  uint64_t version = 1;
};

// UPDATE bounty_requests SET status=to, ... WHERE id=? AND status IN (from...)
struct RequestStatusChange {
  std::string                                    id;
  std::vector<bounty::ledger::v1::RequestStatus> from;
  bounty::ledger::v1::RequestStatus              to = bounty::ledger::v1::REQUEST_STATUS_UNSPECIFIED;

  // Only written when set (publish).
  std::optional<int64_t>     published_at_ms;
  std::optional<std::string> reviewed_by;
  std::optional<int64_t>     reviewed_at_ms;

  int64_t updated_at_ms = 0;
};

// UPDATE bounty_requests SET budget_spent_cents=?, quantity_fulfilled=?, version=version+1 [, status=?]
//  WHERE id=? AND version=? AND budget_spent_cents=? AND quantity_fulfilled=?
struct RequestCounterSwap {
  std::string id;

  uint64_t expected_version            = 0;
  int64_t  expected_budget_spent_cents = 0;
  int64_t  expected_quantity_fulfilled = 0;

  int64_t                                          new_budget_spent_cents = 0;
  int64_t                                          new_quantity_fulfilled = 0;
  std::optional<bounty::ledger::v1::RequestStatus> new_status;

  int64_t updated_at_ms = 0;
};

}
