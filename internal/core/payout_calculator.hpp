#pragma once

#include <cstdint>

#include "bounty/ledger/v1.hpp"
#include "internal/db/model/request_record.hpp"
#include "internal/db/model/submission_record.hpp"

namespace bounty::core {

struct PayoutBreakdown {
  int64_t earned_cents        = 0;
  int64_t speed_bonus_cents   = 0;
  int64_t quality_bonus_cents = 0;
  int64_t bonus_cents         = 0;
  int64_t total_cents         = 0;
};

/*
  Pure payout arithmetic for one accepted submission.

  - per_image pays pay_amount * image_count, flat ignores image_count
  - speed bonus requires a deadline and submitted_at strictly before it
  - quality bonus only when the reviewer says so

  Throws util::InvalidArgument on int64 overflow.
*/
PayoutBreakdown ComputePayout(const db::model::RequestRecord& request, const db::model::SubmissionRecord& submission, uint64_t image_count,
                              bool award_quality_bonus);

bounty::ledger::v1::PayoutBreakdown ToProto(const PayoutBreakdown& payout);

} // namespace bounty::core
