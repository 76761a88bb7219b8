#include "payout_calculator.hpp"

#include <limits>

#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"

namespace bounty::core {

using namespace bounty::ledger::v1;

PayoutBreakdown ComputePayout(const db::model::RequestRecord& request, const db::model::SubmissionRecord& submission, uint64_t image_count,
                              bool award_quality_bonus) {
  PayoutBreakdown out;

  if (request.pay_type == PAY_TYPE_PER_IMAGE) {
    if (image_count > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
      throw util::InvalidArgument("image count out of range");
    }
    out.earned_cents = util::CheckedMul(request.pay_amount_cents, static_cast<int64_t>(image_count));
  } else {
    out.earned_cents = request.pay_amount_cents;
  }

  if (request.speed_bonus_cents > 0 && request.speed_bonus_deadline_ms && submission.submitted_at_ms < *request.speed_bonus_deadline_ms) {
    out.speed_bonus_cents = request.speed_bonus_cents;
  }

  if (award_quality_bonus) {
    out.quality_bonus_cents = request.quality_bonus_cents;
  }

  out.bonus_cents = util::CheckedAdd(out.speed_bonus_cents, out.quality_bonus_cents);
  out.total_cents = util::CheckedAdd(out.earned_cents, out.bonus_cents);
  return out;
}

bounty::ledger::v1::PayoutBreakdown ToProto(const PayoutBreakdown& payout) {
  bounty::ledger::v1::PayoutBreakdown out;
  out.set_earned_amount_cents(payout.earned_cents);
  out.set_speed_bonus_cents(payout.speed_bonus_cents);
  out.set_quality_bonus_cents(payout.quality_bonus_cents);
  out.set_bonus_amount_cents(payout.bonus_cents);
  out.set_total_payout_cents(payout.total_cents);
  return out;
}

} // namespace bounty::core
