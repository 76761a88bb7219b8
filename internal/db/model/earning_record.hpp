#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bounty/ledger/v1.hpp"

namespace bounty::db::model {

/*
  Ledger row. amount_cents / contributor_id are immutable after insert;
  only status and paid_at_ms move through the payout workflow.
*/

struct EarningRecord {
  std::string id;
  std::string contributor_id;
  std::string submission_id;
  std::string request_id;

  // Total owed (earned + bonus).
  int64_t amount_cents       = 0;
  int64_t bonus_amount_cents = 0;

  std::string                       currency = "USD";
  bounty::ledger::v1::EarningStatus status   = bounty::ledger::v1::EARNING_STATUS_PENDING;
  std::string                       description;

  int64_t paid_at_ms    = 0; // 0 = unpaid
  int64_t created_at_ms = 0;
};

struct EarningFilter {
  std::optional<bounty::ledger::v1::EarningStatus> status;
  std::optional<std::string>                       request_id;
  std::size_t                                      limit  = 0; // 0 = unbounded
  std::size_t                                      offset = 0;
  bool                                             include_provisional = false;
};

// UPDATE earnings SET status=to [, paid_at_ms=?] WHERE id=? AND status IN (from...) AND committed
struct EarningStatusChange {
  std::string                                    id;
  std::vector<bounty::ledger::v1::EarningStatus> from;
  bounty::ledger::v1::EarningStatus              to = bounty::ledger::v1::EARNING_STATUS_UNSPECIFIED;
  std::optional<int64_t>                         paid_at_ms;
};

struct EarningTotal {
  bounty::ledger::v1::EarningStatus status       = bounty::ledger::v1::EARNING_STATUS_UNSPECIFIED;
  int64_t                           amount_cents = 0;
  uint64_t                          count        = 0;
};

}
