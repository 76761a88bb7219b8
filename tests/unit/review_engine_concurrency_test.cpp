#include <assert.h>

#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/review_engine.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using namespace bounty::testing;
using bounty::core::ReviewDecision;
using bounty::core::ReviewEngine;
using bounty::core::ReviewEngineOptions;

enum class Outcome { kOk, kConflict, kBudget, kNotReviewable, kOther };

class Barrier {
 public:
  explicit Barrier(int parties) : parties_(parties) {
  }

  void ArriveAndWait() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (++arrived_ == parties_) {
      cv_.notify_all();
      return;
    }
    cv_.wait(lock, [this] { return arrived_ >= parties_; });
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  int                     parties_;
  int                     arrived_ = 0;
};

/*
  Each review opens its transactions in a fixed order
  (snapshot, earning insert, counter swap, submission update). A thread
  that set PauseAtBegin(n) waits on the shared barrier before its n-th
  transaction, so two reviews can be lined up on the same step.
*/
class SteppedRepository final : public ForwardingRepository {
 public:
  explicit SteppedRepository(int parties) : barrier_(parties) {
  }

  static void PauseAtBegin(int n) {
    calls_    = 0;
    pause_at_ = n;
  }

  std::unique_ptr<bounty::db::Transaction> Begin() override {
    if (pause_at_ > 0 && ++calls_ == pause_at_) {
      barrier_.ArriveAndWait();
    }
    return ForwardingRepository::Begin();
  }

 private:
  static thread_local int calls_;
  static thread_local int pause_at_;
  Barrier                 barrier_;
};

thread_local int SteppedRepository::calls_    = 0;
thread_local int SteppedRepository::pause_at_ = 0;

ReviewEngineOptions FastOptions() {
  ReviewEngineOptions options;
  options.compensation_backoff = std::chrono::milliseconds(1);
  return options;
}

Outcome RunReview(ReviewEngine& engine, const ReviewDecision& decision, const std::string& actor) {
  try {
    engine.Review(decision, actor);
    return Outcome::kOk;
  } catch (const bounty::util::ConcurrentModification&) {
    return Outcome::kConflict;
  } catch (const bounty::util::BudgetExceeded&) {
    return Outcome::kBudget;
  } catch (const bounty::util::NotReviewable&) {
    return Outcome::kNotReviewable;
  } catch (const std::exception& e) {
    std::cerr << "unexpected: " << e.what() << "\n";
    return Outcome::kOther;
  }
}

// Two reviews released together at the given transaction step.
std::pair<Outcome, Outcome> RaceAt(ReviewEngine& engine, int step_a, ReviewDecision a,
                                   const std::string& actor_a, int step_b, ReviewDecision b, const std::string& actor_b) {
  Outcome    out_a = Outcome::kOther;
  Outcome    out_b = Outcome::kOther;
  std::thread ta([&] {
    SteppedRepository::PauseAtBegin(step_a);
    out_a = RunReview(engine, a, actor_a);
  });
  std::thread tb([&] {
    SteppedRepository::PauseAtBegin(step_b);
    out_b = RunReview(engine, b, actor_b);
  });
  ta.join();
  tb.join();
  return {out_a, out_b};
}

int Count(std::initializer_list<Outcome> outcomes, Outcome wanted) {
  int n = 0;
  for (auto o : outcomes) n += (o == wanted);
  return n;
}

void TestCounterSwapHasOneWinner() {
  auto         repo = std::make_shared<SteppedRepository>(2);
  ReviewEngine engine(repo, nullptr, TestRoles().AsPredicate(), FastOptions());

  RequestSeed seed;
  seed.budget_total_cents = 1000;
  seed.pay_amount_cents   = 600;
  const auto request      = SeedRequest(*repo, seed);
  const auto s1           = SeedSubmission(*repo, request.id);
  const auto s2           = SeedSubmission(*repo, request.id);

  // Both pass the budget check on the same snapshot, then race the swap.
  const auto [a, b] = RaceAt(engine, 3, ReviewDecision{s1.id, REVIEW_ACTION_ACCEPT, "", false}, kAdmin, 3,
                             ReviewDecision{s2.id, REVIEW_ACTION_ACCEPT, "", false}, kSuperAdmin);

  assert(Count({a, b}, Outcome::kOk) == 1);
  assert(Count({a, b}, Outcome::kConflict) == 1);

  const auto after = LoadRequest(*repo, request.id);
  assert(after.budget_spent_cents == 600);
  assert(after.quantity_fulfilled == 1);
  assert(EarningsFor(*repo, request.id).size() == 1);
  AssertLedgerConsistent(*repo, request.id);
}

void TestDuplicateAcceptOfOneSubmission() {
  auto         repo = std::make_shared<SteppedRepository>(2);
  ReviewEngine engine(repo, nullptr, TestRoles().AsPredicate(), FastOptions());

  const auto request = SeedRequest(*repo);
  const auto s       = SeedSubmission(*repo, request.id);
  const auto accept  = ReviewDecision{s.id, REVIEW_ACTION_ACCEPT, "", false};

  // Both snapshots see the submission awaiting review; only one earning insert lands.
  const auto [a, b] = RaceAt(engine, 2, accept, kAdmin, 2, accept, kSuperAdmin);

  assert(Count({a, b}, Outcome::kOk) == 1);
  assert(Count({a, b}, Outcome::kConflict) == 1);
  assert(LoadRequest(*repo, request.id).quantity_fulfilled == 1);
  AssertLedgerConsistent(*repo, request.id);
}

void TestAcceptRacingReject() {
  for (int round = 0; round < 20; ++round) {
    auto         repo = std::make_shared<SteppedRepository>(2);
    ReviewEngine engine(repo, nullptr, TestRoles().AsPredicate(), FastOptions());

    const auto request = SeedRequest(*repo);
    const auto s       = SeedSubmission(*repo, request.id);

    // Accept pauses before inserting its earning, reject before its conditional update.
    const auto [a, r] = RaceAt(engine, 2, ReviewDecision{s.id, REVIEW_ACTION_ACCEPT, "", false}, kAdmin, 2,
                               ReviewDecision{s.id, REVIEW_ACTION_REJECT, "no", false}, kReviewer);

    assert(Count({a, r}, Outcome::kOk) == 1);
    assert(Count({a, r}, Outcome::kConflict) == 1);

    const auto sub = LoadSubmission(*repo, s.id);
    if (a == Outcome::kOk) {
      assert(sub.status == SUBMISSION_STATUS_ACCEPTED);
    } else {
      assert(sub.status == SUBMISSION_STATUS_REJECTED);
    }
    AssertLedgerConsistent(*repo, request.id);
  }
}

void TestManyReviewersNeverOverspend() {
  auto         repo = std::make_shared<SteppedRepository>(1);
  ReviewEngine engine(repo, nullptr, TestRoles().AsPredicate(), FastOptions());

  RequestSeed seed;
  seed.budget_total_cents = 3000;
  seed.pay_amount_cents   = 600;
  seed.quantity_needed    = 10;
  const auto request      = SeedRequest(*repo, seed);

  std::vector<std::string> ids;
  for (int i = 0; i < 8; ++i) ids.push_back(SeedSubmission(*repo, request.id).id);

  std::vector<Outcome>     outcomes(ids.size(), Outcome::kOther);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < ids.size(); ++i) {
    threads.emplace_back([&, i] {
      SteppedRepository::PauseAtBegin(0);
      // Caller-side retry: the engine itself never retries a lost swap.
      for (int attempt = 0; attempt < 50; ++attempt) {
        outcomes[i] = RunReview(engine, ReviewDecision{ids[i], REVIEW_ACTION_ACCEPT, "", false}, kAdmin);
        if (outcomes[i] != Outcome::kConflict) break;
        std::this_thread::yield();
      }
    });
  }
  for (auto& t : threads) t.join();

  int accepted = 0;
  for (auto o : outcomes) {
    assert(o == Outcome::kOk || o == Outcome::kBudget || o == Outcome::kConflict);
    accepted += (o == Outcome::kOk);
  }
  assert(accepted <= 5);

  const auto after = LoadRequest(*repo, request.id);
  assert(after.budget_spent_cents == accepted * 600);
  AssertLedgerConsistent(*repo, request.id);
}

} // namespace

int main() {
  TestCounterSwapHasOneWinner();
  TestDuplicateAcceptOfOneSubmission();
  TestAcceptRacingReject();
  TestManyReviewersNeverOverspend();

  std::cout << "bounty_ledger_unit_review_engine_concurrency: pass\n";
  return 0;
}
