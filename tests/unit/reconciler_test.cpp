#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/reconciler.hpp"
#include "internal/core/review_engine.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using namespace bounty::testing;
using bounty::core::Reconciler;
using bounty::core::ReviewDecision;
using bounty::core::ReviewEngine;
using bounty::core::ReviewEngineOptions;
using bounty::db::ErrorCode;
using bounty::db::Result;

// Fails the step that marks a submission accepted, or the compensating delete.
class FaultyRepository final : public ForwardingRepository {
 public:
  Result ReviewSubmissionIf(bounty::db::Transaction& tx, const bounty::db::model::SubmissionReview& review) override {
    if (fail_accept && !review.earning_id.empty()) return Result::Err(ErrorCode::InternalError, "crash before step 8");
    return ForwardingRepository::ReviewSubmissionIf(tx, review);
  }

  Result DeleteProvisionalEarning(bounty::db::Transaction& tx, const std::string& id) override {
    if (fail_delete) return Result::Err(ErrorCode::InternalError, "delete lost");
    return ForwardingRepository::DeleteProvisionalEarning(tx, id);
  }

  bool fail_accept = false;
  bool fail_delete = false;
};

// Runs `between` once, after a provisional earning has been committed and
// before the reviewer's next transaction begins.
class InterleavingRepository final : public ForwardingRepository {
 public:
  std::unique_ptr<bounty::db::Transaction> Begin() override {
    if (armed_) {
      armed_    = false;
      auto hook = std::move(between);
      between   = nullptr;
      if (hook) hook();
    }
    return ForwardingRepository::Begin();
  }

  Result InsertEarning(bounty::db::Transaction& tx, bounty::db::model::EarningRecord& r) override {
    auto res = ForwardingRepository::InsertEarning(tx, r);
    if (res) armed_ = true;
    return res;
  }

  std::function<void()> between;

 private:
  bool armed_ = false;
};

struct Fixture {
  std::shared_ptr<FaultyRepository> repo = std::make_shared<FaultyRepository>();
  std::shared_ptr<ReviewEngine>     engine = std::make_shared<ReviewEngine>(repo, nullptr, TestRoles().AsPredicate(), Options());
  Reconciler                        reconciler{repo, engine, TestRoles().AsPredicate()};

  static ReviewEngineOptions Options() {
    ReviewEngineOptions options;
    options.compensation_max_attempts = 1;
    options.compensation_backoff      = std::chrono::milliseconds(1);
    return options;
  }

  void Accept(const std::string& id) {
    engine->Review(ReviewDecision{id, REVIEW_ACTION_ACCEPT, "", false}, kAdmin);
  }
};

void TestCleanStoreReportsNothing() {
  Fixture    f;
  const auto request = SeedRequest(*f.repo);
  f.Accept(SeedSubmission(*f.repo, request.id).id);

  const auto report = f.reconciler.Reconcile(0, true, kSuperAdmin);
  assert(report.stranded_submission_ids.empty());
  assert(report.orphan_earning_ids.empty());
  assert(report.drifted_request_ids.empty());
  assert(report.repaired == 0);
}

void TestStrandedAcceptanceIsCompleted() {
  Fixture    f;
  const auto request = SeedRequest(*f.repo);
  const auto s       = SeedSubmission(*f.repo, request.id);

  f.repo->fail_accept = true;
  assert(Throws<bounty::util::AcceptanceStranded>([&] { f.Accept(s.id); }));
  f.repo->fail_accept = false;

  // Counters moved, submission did not.
  assert(LoadRequest(*f.repo, request.id).quantity_fulfilled == 1);
  assert(LoadSubmission(*f.repo, s.id).status == SUBMISSION_STATUS_SUBMITTED);

  const auto dry = f.reconciler.Reconcile(0, false, kSuperAdmin);
  assert(dry.stranded_submission_ids.size() == 1);
  assert(dry.stranded_submission_ids[0] == s.id);
  assert(dry.repaired == 0);
  assert(LoadSubmission(*f.repo, s.id).status == SUBMISSION_STATUS_SUBMITTED);

  const auto fixed = f.reconciler.Reconcile(0, true, kSuperAdmin);
  assert(fixed.repaired == 1);

  const auto sub = LoadSubmission(*f.repo, s.id);
  assert(sub.status == SUBMISSION_STATUS_ACCEPTED);
  assert(!sub.earning_id.empty());
  AssertLedgerConsistent(*f.repo, request.id);

  assert(f.reconciler.Reconcile(0, true, kSuperAdmin).stranded_submission_ids.empty());
}

void TestOrphanEarningIsDeleted() {
  Fixture     f;
  RequestSeed seed;
  seed.budget_total_cents = 1000;
  seed.pay_amount_cents   = 1500;
  const auto request      = SeedRequest(*f.repo, seed);
  const auto s            = SeedSubmission(*f.repo, request.id);

  f.repo->fail_delete = true;
  assert(Throws<bounty::util::BudgetExceeded>([&] { f.Accept(s.id); }));
  f.repo->fail_delete = false;
  assert(EarningsFor(*f.repo, request.id).size() == 1);

  const auto report = f.reconciler.Reconcile(0, true, kSuperAdmin);
  assert(report.orphan_earning_ids.size() == 1);
  assert(report.repaired == 1);
  assert(EarningsFor(*f.repo, request.id).empty());
  AssertLedgerConsistent(*f.repo, request.id);

  // The claim is gone, so the submission can be declined again.
  assert(f.engine->Review(ReviewDecision{s.id, REVIEW_ACTION_REJECT, "over budget", false}, kReviewer).submission.status ==
         SUBMISSION_STATUS_REJECTED);
}

void TestOrphanRepairFencesReviewInFlight() {
  auto       repo   = std::make_shared<InterleavingRepository>();
  auto       engine = std::make_shared<ReviewEngine>(repo, nullptr, TestRoles().AsPredicate(), Fixture::Options());
  Reconciler reconciler(repo, engine, TestRoles().AsPredicate());

  const auto request = SeedRequest(*repo);
  const auto s       = SeedSubmission(*repo, request.id);
  const ReviewDecision accept{s.id, REVIEW_ACTION_ACCEPT, "", false};

  // With no grace period the in-flight earning looks orphaned.
  bounty::core::ReconcileReport during;
  repo->between = [&] { during = reconciler.Reconcile(0, true, kSuperAdmin); };
  assert(Throws<bounty::util::ConcurrentModification>([&] { engine->Review(accept, kAdmin); }));
  assert(during.orphan_earning_ids.size() == 1);
  assert(during.repaired == 1);

  const auto after = LoadRequest(*repo, request.id);
  assert(after.budget_spent_cents == 0);
  assert(after.quantity_fulfilled == 0);
  assert(LoadSubmission(*repo, s.id).status == SUBMISSION_STATUS_SUBMITTED);
  assert(EarningsFor(*repo, request.id).empty());
  AssertLedgerConsistent(*repo, request.id);

  const auto again = reconciler.Reconcile(0, true, kSuperAdmin);
  assert(again.orphan_earning_ids.empty());
  assert(again.stranded_submission_ids.empty());
  assert(again.drifted_request_ids.empty());

  assert(engine->Review(accept, kAdmin).submission.status == SUBMISSION_STATUS_ACCEPTED);
  AssertLedgerConsistent(*repo, request.id);
}

void TestDriftIsReportedNotRepaired() {
  Fixture    f;
  const auto request = SeedRequest(*f.repo);
  f.Accept(SeedSubmission(*f.repo, request.id).id);

  const auto current = LoadRequest(*f.repo, request.id);
  {
    bounty::db::model::RequestCounterSwap swap;
    swap.id                          = current.id;
    swap.expected_version            = current.version;
    swap.expected_budget_spent_cents = current.budget_spent_cents;
    swap.expected_quantity_fulfilled = current.quantity_fulfilled;
    swap.new_budget_spent_cents      = current.budget_spent_cents + 123;
    swap.new_quantity_fulfilled      = current.quantity_fulfilled;
    auto tx                          = f.repo->Begin();
    auto res                         = f.repo->SwapRequestCounters(*tx, swap);
    assert(res);
    tx->Commit();
  }

  const auto report = f.reconciler.Reconcile(0, true, kSuperAdmin);
  assert(report.drifted_request_ids.size() == 1);
  assert(report.drifted_request_ids[0] == request.id);
  assert(report.repaired == 0);
  assert(LoadRequest(*f.repo, request.id).budget_spent_cents == current.budget_spent_cents + 123);
}

void TestGracePeriodSkipsRecentEarnings() {
  Fixture    f;
  const auto request = SeedRequest(*f.repo);
  const auto s       = SeedSubmission(*f.repo, request.id);

  f.repo->fail_accept = true;
  assert(Throws<bounty::util::AcceptanceStranded>([&] { f.Accept(s.id); }));
  f.repo->fail_accept = false;

  const auto report = f.reconciler.Reconcile(3'600'000, true, kSuperAdmin);
  assert(report.stranded_submission_ids.empty());
  assert(report.drifted_request_ids.empty());
  assert(LoadSubmission(*f.repo, s.id).status == SUBMISSION_STATUS_SUBMITTED);
}

void TestRequiresSuperAdmin() {
  Fixture f;
  assert(Throws<bounty::util::PermissionDenied>([&] { f.reconciler.Reconcile(0, false, kAdmin); }));
}

} // namespace

int main() {
  TestCleanStoreReportsNothing();
  TestStrandedAcceptanceIsCompleted();
  TestOrphanEarningIsDeleted();
  TestOrphanRepairFencesReviewInFlight();
  TestDriftIsReportedNotRepaired();
  TestGracePeriodSkipsRecentEarnings();
  TestRequiresSuperAdmin();

  std::cout << "bounty_ledger_unit_reconciler: pass\n";
  return 0;
}
