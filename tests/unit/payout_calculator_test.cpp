#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

#include "internal/core/payout_calculator.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using namespace bounty::testing;
using bounty::core::ComputePayout;

bounty::db::model::RequestRecord Request(PayType type, int64_t pay) {
  bounty::db::model::RequestRecord r;
  r.pay_type         = type;
  r.pay_amount_cents = pay;
  return r;
}

bounty::db::model::SubmissionRecord SubmittedAt(int64_t ms) {
  bounty::db::model::SubmissionRecord s;
  s.submitted_at_ms = ms;
  return s;
}

void TestFlatIgnoresImageCount() {
  const auto p = ComputePayout(Request(PAY_TYPE_FLAT, 600), SubmittedAt(1), 7, false);
  assert(p.earned_cents == 600);
  assert(p.bonus_cents == 0);
  assert(p.total_cents == 600);
}

void TestPerImageMultiplies() {
  const auto p = ComputePayout(Request(PAY_TYPE_PER_IMAGE, 150), SubmittedAt(1), 4, false);
  assert(p.earned_cents == 600);
  assert(p.total_cents == 600);

  const auto none = ComputePayout(Request(PAY_TYPE_PER_IMAGE, 150), SubmittedAt(1), 0, false);
  assert(none.total_cents == 0);
}

void TestSpeedBonusIsStrictlyBeforeDeadline() {
  const int64_t deadline = 1'700'000'000'000;
  auto          request  = Request(PAY_TYPE_FLAT, 500);
  request.speed_bonus_cents       = 100;
  request.speed_bonus_deadline_ms = deadline;

  const auto early = ComputePayout(request, SubmittedAt(deadline - 1000), 1, false);
  assert(early.speed_bonus_cents == 100);
  assert(early.total_cents == 600);

  const auto late = ComputePayout(request, SubmittedAt(deadline + 1000), 1, false);
  assert(late.speed_bonus_cents == 0);
  assert(late.total_cents == 500);

  const auto exact = ComputePayout(request, SubmittedAt(deadline), 1, false);
  assert(exact.speed_bonus_cents == 0);
}

void TestSpeedBonusNeedsDeadline() {
  auto request              = Request(PAY_TYPE_FLAT, 500);
  request.speed_bonus_cents = 100;
  assert(ComputePayout(request, SubmittedAt(1), 1, false).speed_bonus_cents == 0);
}

void TestQualityBonusOnlyWhenAwarded() {
  auto request                = Request(PAY_TYPE_FLAT, 500);
  request.quality_bonus_cents = 250;

  assert(ComputePayout(request, SubmittedAt(1), 1, false).quality_bonus_cents == 0);

  const auto awarded = ComputePayout(request, SubmittedAt(1), 1, true);
  assert(awarded.quality_bonus_cents == 250);
  assert(awarded.bonus_cents == 250);
  assert(awarded.total_cents == 750);
}

void TestBonusesStack() {
  auto request                    = Request(PAY_TYPE_PER_IMAGE, 200);
  request.speed_bonus_cents       = 100;
  request.speed_bonus_deadline_ms = 10'000;
  request.quality_bonus_cents     = 50;

  const auto p = ComputePayout(request, SubmittedAt(5'000), 3, true);
  assert(p.earned_cents == 600);
  assert(p.bonus_cents == 150);
  assert(p.total_cents == p.earned_cents + p.bonus_cents);

  const auto proto = bounty::core::ToProto(p);
  assert(proto.total_payout_cents() == 750);
  assert(proto.speed_bonus_cents() == 100);
}

void TestOverflowIsRejected() {
  const auto huge = Request(PAY_TYPE_PER_IMAGE, std::numeric_limits<int64_t>::max() / 2);
  assert(Throws<bounty::util::InvalidArgument>([&] { ComputePayout(huge, SubmittedAt(1), 3, false); }));
}

} // namespace

int main() {
  TestFlatIgnoresImageCount();
  TestPerImageMultiplies();
  TestSpeedBonusIsStrictlyBeforeDeadline();
  TestSpeedBonusNeedsDeadline();
  TestQualityBonusOnlyWhenAwarded();
  TestBonusesStack();
  TestOverflowIsRejected();

  std::cout << "bounty_ledger_unit_payout_calculator: pass\n";
  return 0;
}
