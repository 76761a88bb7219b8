#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#if BOUNTY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using bounty::db::ErrorCode;
using bounty::db::Repository;
using namespace bounty::db::model;
using namespace bounty::ledger::v1;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                 name;
  std::function<std::shared_ptr<Repository>()> make_repository;
  bool                                        supports_restart = false;
  std::function<void()>                       cleanup;
};

RequestRecord PublishedRequest(const std::string& title) {
  RequestRecord r;
  r.created_by         = "22222222-2222-4222-8222-222222222222";
  r.title              = title;
  r.status             = REQUEST_STATUS_PUBLISHED;
  r.pay_type           = PAY_TYPE_FLAT;
  r.pay_amount_cents   = 500;
  r.budget_total_cents = 10000;
  r.quantity_needed    = 10;
  r.published_at_ms    = NowMs();
  return r;
}

SubmissionRecord PendingSubmission(const std::string& request_id, int64_t submitted_at_ms) {
  SubmissionRecord s;
  s.request_id      = request_id;
  s.contributor_id  = "44444444-4444-4444-8444-444444444444";
  s.submitted_at_ms = submitted_at_ms;
  return s;
}

EarningRecord EarningFor(const SubmissionRecord& s, int64_t amount_cents) {
  EarningRecord e;
  e.contributor_id = s.contributor_id;
  e.submission_id  = s.id;
  e.request_id     = s.request_id;
  e.amount_cents   = amount_cents;
  e.description    = "Bounty: parity";
  return e;
}

void VerifyRequestLifecycle(Repository& repo) {
  auto tx = repo.Begin();

  auto draft   = PublishedRequest("draft");
  draft.status = REQUEST_STATUS_DRAFT;
  assert(repo.InsertRequest(*tx, draft));
  assert(!draft.id.empty());
  assert(draft.created_at_ms > 0);

  auto loaded = repo.GetRequest(*tx, draft.id);
  assert(loaded.has_value());
  assert(loaded->title == "draft");
  assert(loaded->status == REQUEST_STATUS_DRAFT);

  RequestStatusChange wrong{.id = draft.id, .from = {REQUEST_STATUS_PUBLISHED}, .to = REQUEST_STATUS_PAUSED, .updated_at_ms = NowMs()};
  assert(repo.TransitionRequestIf(*tx, wrong).code == ErrorCode::Conflict);

  RequestStatusChange publish{.id              = draft.id,
                              .from            = {REQUEST_STATUS_DRAFT},
                              .to              = REQUEST_STATUS_PUBLISHED,
                              .published_at_ms = NowMs(),
                              .updated_at_ms   = NowMs()};
  assert(repo.TransitionRequestIf(*tx, publish));

  auto published = repo.GetRequest(*tx, draft.id);
  assert(published->status == REQUEST_STATUS_PUBLISHED);
  assert(published->published_at_ms == *publish.published_at_ms);
  assert(published->version > loaded->version);

  bool listed = false;
  for (const auto& r : repo.ListRequests(*tx, REQUEST_STATUS_PUBLISHED)) {
    listed = listed || r.id == draft.id;
  }
  assert(listed);
  for (const auto& r : repo.ListRequests(*tx, REQUEST_STATUS_DRAFT)) {
    assert(r.id != draft.id);
  }

  assert(!repo.GetRequest(*tx, "00000000-0000-4000-8000-000000000000").has_value());
  tx->Commit();
}

void VerifyCounterSwap(Repository& repo) {
  auto tx = repo.Begin();

  auto request = PublishedRequest("counters");
  assert(repo.InsertRequest(*tx, request));
  auto before = *repo.GetRequest(*tx, request.id);

  RequestCounterSwap swap;
  swap.id                          = request.id;
  swap.expected_version            = before.version;
  swap.expected_budget_spent_cents = 0;
  swap.expected_quantity_fulfilled = 0;
  swap.new_budget_spent_cents      = 500;
  swap.new_quantity_fulfilled      = 1;
  swap.updated_at_ms               = NowMs();
  assert(repo.SwapRequestCounters(*tx, swap));

  // Same expectation again is a lost race.
  assert(repo.SwapRequestCounters(*tx, swap).code == ErrorCode::Conflict);

  auto after = *repo.GetRequest(*tx, request.id);
  assert(after.budget_spent_cents == 500);
  assert(after.quantity_fulfilled == 1);
  assert(after.version == before.version + 1);
  assert(after.status == REQUEST_STATUS_PUBLISHED);

  swap.expected_version            = after.version;
  swap.expected_budget_spent_cents = 500;
  swap.expected_quantity_fulfilled = 1;
  swap.new_budget_spent_cents      = 1000;
  swap.new_quantity_fulfilled      = 2;
  swap.new_status                  = REQUEST_STATUS_FULFILLED;
  assert(repo.SwapRequestCounters(*tx, swap));
  assert(repo.GetRequest(*tx, request.id)->status == REQUEST_STATUS_FULFILLED);

  tx->Commit();
}

void VerifySubmissionsAndEarningClaim(Repository& repo) {
  auto tx = repo.Begin();

  auto request = PublishedRequest("claims");
  assert(repo.InsertRequest(*tx, request));

  auto later   = PendingSubmission(request.id, 2000);
  auto earlier = PendingSubmission(request.id, 1000);
  assert(repo.InsertSubmission(*tx, later));
  assert(repo.InsertSubmission(*tx, earlier));

  SubmissionImageRecord image{.submission_id = earlier.id, .file_path = "uploads/a.jpg"};
  assert(repo.InsertSubmissionImage(*tx, image));
  assert(repo.CountSubmissionImages(*tx, earlier.id) == 1);
  assert(repo.CountSubmissionImages(*tx, later.id) == 0);

  auto pending = repo.ListSubmissions(*tx, SubmissionFilter{.request_id = request.id, .status = SUBMISSION_STATUS_SUBMITTED});
  assert(pending.size() == 2);
  assert(pending[0].id == earlier.id);
  assert(pending[1].id == later.id);
  assert(repo.ListSubmissions(*tx, SubmissionFilter{.request_id = request.id, .limit = 1}).size() == 1);

  auto earning = EarningFor(earlier, 500);
  assert(repo.InsertEarning(*tx, earning));
  assert(!earning.id.empty());

  auto duplicate = EarningFor(earlier, 500);
  assert(repo.InsertEarning(*tx, duplicate).code == ErrorCode::AlreadyExists);

  // A decline cannot land once an earning claims the submission.
  SubmissionReview reject{.id             = earlier.id,
                          .from           = {SUBMISSION_STATUS_SUBMITTED, SUBMISSION_STATUS_IN_REVIEW},
                          .to             = SUBMISSION_STATUS_REJECTED,
                          .reviewed_by    = "11111111-1111-4111-8111-111111111111",
                          .reviewed_at_ms = NowMs(),
                          .updated_at_ms  = NowMs()};
  assert(repo.ReviewSubmissionIf(*tx, reject).code == ErrorCode::Conflict);

  SubmissionReview accept{.id                  = earlier.id,
                          .from                = {SUBMISSION_STATUS_SUBMITTED, SUBMISSION_STATUS_IN_REVIEW},
                          .to                  = SUBMISSION_STATUS_ACCEPTED,
                          .reviewed_by         = "22222222-2222-4222-8222-222222222222",
                          .reviewed_at_ms      = NowMs(),
                          .earned_amount_cents = 500,
                          .earning_id          = earning.id,
                          .updated_at_ms       = NowMs()};
  assert(repo.ReviewSubmissionIf(*tx, accept));
  assert(repo.ReviewSubmissionIf(*tx, accept).code == ErrorCode::Conflict);

  auto accepted = *repo.GetSubmission(*tx, earlier.id);
  assert(accepted.status == SUBMISSION_STATUS_ACCEPTED);
  assert(accepted.earning_id == earning.id);
  assert(accepted.earned_amount_cents == 500);

  // The other submission declines cleanly, then can no longer be claimed.
  reject.id = later.id;
  assert(repo.ReviewSubmissionIf(*tx, reject));
  auto late_claim = EarningFor(later, 500);
  assert(repo.InsertEarning(*tx, late_claim).code == ErrorCode::Conflict);

  tx->Commit();
}

void VerifyEarningsWorkflow(Repository& repo) {
  auto tx = repo.Begin();

  auto request = PublishedRequest("earnings");
  assert(repo.InsertRequest(*tx, request));

  // The first two are committed by their accepted submissions; the third stays provisional.
  std::vector<EarningRecord> earnings;
  for (int i = 0; i < 3; ++i) {
    auto s = PendingSubmission(request.id, 1000 + i);
    assert(repo.InsertSubmission(*tx, s));
    auto e          = EarningFor(s, 100 * (i + 1));
    e.created_at_ms = NowMs() + i;
    assert(repo.InsertEarning(*tx, e));
    earnings.push_back(e);
    if (i == 2) break;

    SubmissionReview accept{.id                  = s.id,
                            .from                = {SUBMISSION_STATUS_SUBMITTED, SUBMISSION_STATUS_IN_REVIEW},
                            .to                  = SUBMISSION_STATUS_ACCEPTED,
                            .reviewed_by         = "22222222-2222-4222-8222-222222222222",
                            .reviewed_at_ms      = NowMs(),
                            .earned_amount_cents = e.amount_cents,
                            .earning_id          = e.id,
                            .updated_at_ms       = NowMs()};
    assert(repo.ReviewSubmissionIf(*tx, accept));
  }

  auto listed = repo.ListEarnings(*tx, EarningFilter{.request_id = request.id});
  assert(listed.size() == 2);
  assert(listed.front().id == earnings[1].id);

  auto everything = repo.ListEarnings(*tx, EarningFilter{.request_id = request.id, .include_provisional = true});
  assert(everything.size() == 3);
  assert(everything.front().id == earnings[2].id);
  assert(repo.ListEarnings(*tx, EarningFilter{.request_id = request.id, .limit = 2, .offset = 2, .include_provisional = true}).size() == 1);

  EarningStatusChange early{.id = earnings[2].id, .from = {EARNING_STATUS_PENDING}, .to = EARNING_STATUS_PROCESSING};
  assert(repo.UpdateEarningStatusIf(*tx, early).code == ErrorCode::Conflict);

  EarningStatusChange paid{.id = earnings[0].id, .from = {EARNING_STATUS_PROCESSING}, .to = EARNING_STATUS_PAID, .paid_at_ms = NowMs()};
  assert(repo.UpdateEarningStatusIf(*tx, paid).code == ErrorCode::Conflict);

  EarningStatusChange process{.id = earnings[0].id, .from = {EARNING_STATUS_PENDING}, .to = EARNING_STATUS_PROCESSING};
  assert(repo.UpdateEarningStatusIf(*tx, process));
  assert(repo.UpdateEarningStatusIf(*tx, paid));

  auto paid_row = *repo.GetEarning(*tx, earnings[0].id);
  assert(paid_row.status == EARNING_STATUS_PAID);
  assert(paid_row.paid_at_ms == *paid.paid_at_ms);

  const auto committed = repo.CountEarnings(*tx, std::nullopt);
  assert(repo.CountEarnings(*tx, EARNING_STATUS_PAID) >= 1);
  assert(committed == repo.ListEarnings(*tx, EarningFilter{}).size());
  assert(committed < repo.ListEarnings(*tx, EarningFilter{.include_provisional = true}).size());

  int64_t  paid_total   = 0;
  uint64_t summed_count = 0;
  for (const auto& total : repo.SumEarningsByStatus(*tx)) {
    if (total.status == EARNING_STATUS_PAID) paid_total = total.amount_cents;
    summed_count += total.count;
  }
  assert(paid_total >= 100);
  assert(summed_count == committed);

  // Only a pending, unclaimed row can be compensated away.
  assert(repo.DeleteProvisionalEarning(*tx, earnings[0].id).code == ErrorCode::Conflict);
  assert(repo.DeleteProvisionalEarning(*tx, earnings[1].id).code == ErrorCode::Conflict);
  assert(repo.GetEarning(*tx, earnings[1].id).has_value());
  assert(repo.DeleteProvisionalEarning(*tx, earnings[2].id));
  assert(!repo.GetEarning(*tx, earnings[2].id).has_value());
  assert(repo.DeleteProvisionalEarning(*tx, earnings[2].id));

  tx->Commit();
}

// A decline racing an uncommitted claim must see the claim once it commits.
void VerifyClaimBlocksConcurrentDecline(Repository& repo) {
  auto request = PublishedRequest("claim race");
  auto s       = PendingSubmission(request.id, NowMs());
  {
    auto tx = repo.Begin();
    assert(repo.InsertRequest(*tx, request));
    assert(repo.InsertSubmission(*tx, s));
    tx->Commit();
  }

  auto claim = repo.Begin();
  auto e     = EarningFor(s, 500);
  assert(repo.InsertEarning(*claim, e));

  ErrorCode   decline_code = ErrorCode::OK;
  std::thread decline([&] {
    SubmissionReview reject{.id             = s.id,
                            .from           = {SUBMISSION_STATUS_SUBMITTED, SUBMISSION_STATUS_IN_REVIEW},
                            .to             = SUBMISSION_STATUS_REJECTED,
                            .reviewed_by    = "11111111-1111-4111-8111-111111111111",
                            .reviewed_at_ms = NowMs(),
                            .updated_at_ms  = NowMs()};
    auto tx      = repo.Begin();
    decline_code = repo.ReviewSubmissionIf(*tx, reject).code;
    if (decline_code == ErrorCode::OK) {
      tx->Commit();
    } else {
      tx->Rollback();
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  claim->Commit();
  decline.join();

  assert(decline_code == ErrorCode::Conflict);
  auto tx = repo.Begin();
  assert(repo.GetSubmission(*tx, s.id)->status == SUBMISSION_STATUS_SUBMITTED);
  assert(repo.GetEarning(*tx, e.id).has_value());
  tx->Commit();
}

void VerifyActivityFeed(Repository& repo) {
  const std::string contributor = "55555555-5555-4555-8555-555555555555";
  auto              tx          = repo.Begin();

  for (int i = 0; i < 3; ++i) {
    ActivityRecord a{.contributor_id = contributor,
                     .action         = "submission_accepted",
                     .description    = "entry " + std::to_string(i),
                     .metadata_json  = "{}",
                     .created_at_ms  = NowMs()};
    assert(repo.AppendActivity(*tx, a));
    assert(a.id > 0);
  }

  auto feed = repo.ListActivity(*tx, contributor, 2);
  assert(feed.size() == 2);
  assert(feed[0].description == "entry 2");
  assert(feed[1].description == "entry 1");
  assert(repo.ListActivity(*tx, "66666666-6666-4666-8666-666666666666", 10).empty());

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  std::string id;
  {
    auto tx      = repo.Begin();
    auto request = PublishedRequest("rolled back");
    assert(repo.InsertRequest(*tx, request));
    id = request.id;
    tx->Rollback();
  }
  {
    auto tx      = repo.Begin();
    auto request = PublishedRequest("dropped");
    assert(repo.InsertRequest(*tx, request));
    assert(!tx->IsCommitted());
  }

  auto tx = repo.Begin();
  assert(!repo.GetRequest(*tx, id).has_value());
  for (const auto& r : repo.ListRequests(*tx, std::nullopt)) {
    assert(r.title != "dropped");
  }
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart) {
    return;
  }

  std::string id;
  {
    auto repo    = backend.make_repository();
    auto tx      = repo->Begin();
    auto request = PublishedRequest("durable");
    assert(repo->InsertRequest(*tx, request));
    id = request.id;
    tx->Commit();
  }

  auto repo = backend.make_repository();
  auto tx   = repo->Begin();
  auto read = repo->GetRequest(*tx, id);
  assert(read.has_value());
  assert(read->title == "durable");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<bounty::db::memory::MemoryRepository>(); },
      .supports_restart = false,
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("bounty_ledger_parity_" + std::to_string(NowMs()) + ".db")).string();

  return BackendFactory{
      .name = "sqlite",
      .make_repository =
          [db_path]() {
            auto db = std::make_shared<bounty::db::sqlite::SqliteDB>(db_path);
            db->Migrate();
            return std::make_shared<bounty::db::sqlite::SqliteRepository>(std::move(db));
          },
      .supports_restart = true,
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}

#if BOUNTY_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("BOUNTY_TEST_PG_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("BOUNTY_TEST_PG_URI is not set");
  }

  auto conninfo = std::string(uri);
  return BackendFactory{
      .name = "postgres",
      .make_repository =
          [conninfo]() {
            auto pool = std::make_shared<bounty::db::postgres::PgPool>(conninfo, 4);
            pool->Migrate();
            return std::make_shared<bounty::db::postgres::PgRepository>(std::move(pool));
          },
      .supports_restart = true,
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyRequestLifecycle(*repo);
  VerifyCounterSwap(*repo);
  VerifySubmissionsAndEarningClaim(*repo);
  VerifyEarningsWorkflow(*repo);
  VerifyClaimBlocksConcurrentDecline(*repo);
  VerifyActivityFeed(*repo);
  VerifyRollbackBehavior(*repo);

  repo.reset();
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

#if BOUNTY_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "bounty_ledger_integration_repository_parity: pass\n";
  return 0;
}
