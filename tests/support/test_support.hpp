#pragma once

#include <cassert>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bounty/ledger/v1.hpp"
#include "internal/auth/role_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/notifier.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace bounty::testing {

using namespace bounty::ledger::v1;

inline const std::string kReviewer    = "11111111-1111-4111-8111-111111111111";
inline const std::string kAdmin       = "22222222-2222-4222-8222-222222222222";
inline const std::string kSuperAdmin  = "33333333-3333-4333-8333-333333333333";
inline const std::string kContributor = "44444444-4444-4444-8444-444444444444";
inline const std::string kStranger    = "55555555-5555-4555-8555-555555555555";

inline auth::RolePolicy TestRoles() {
  return auth::RolePolicy({{kReviewer, ADMIN_ROLE_REVIEWER}, {kAdmin, ADMIN_ROLE_ADMIN}, {kSuperAdmin, ADMIN_ROLE_SUPER_ADMIN}});
}

template <typename E, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

struct RequestSeed {
  PayType                pay_type            = PAY_TYPE_FLAT;
  int64_t                pay_amount_cents    = 500;
  int64_t                speed_bonus_cents   = 0;
  std::optional<int64_t> speed_bonus_deadline_ms;
  int64_t                quality_bonus_cents = 0;
  int64_t                budget_total_cents  = 10000;
  int64_t                quantity_needed     = 10;
  RequestStatus          status              = REQUEST_STATUS_PUBLISHED;
};

inline db::model::RequestRecord SeedRequest(db::Repository& repo, const RequestSeed& seed = {}) {
  db::model::RequestRecord record;
  record.created_by              = kAdmin;
  record.title                   = "Storefront photos";
  record.description             = "Photograph the storefront from the street.";
  record.status                  = seed.status;
  record.pay_type                = seed.pay_type;
  record.pay_amount_cents        = seed.pay_amount_cents;
  record.speed_bonus_cents       = seed.speed_bonus_cents;
  record.speed_bonus_deadline_ms = seed.speed_bonus_deadline_ms;
  record.quality_bonus_cents     = seed.quality_bonus_cents;
  record.budget_total_cents      = seed.budget_total_cents;
  record.quantity_needed         = seed.quantity_needed;
  record.updated_at_ms           = util::NowMs();

  auto tx  = repo.Begin();
  auto res = repo.InsertRequest(*tx, record);
  assert(res);
  tx->Commit();
  return record;
}

inline db::model::SubmissionRecord SeedSubmission(db::Repository& repo, const std::string& request_id, int64_t submitted_at_ms = 0,
                                                  int images = 1, const std::string& contributor = kContributor) {
  db::model::SubmissionRecord record;
  record.request_id      = request_id;
  record.contributor_id  = contributor;
  record.status          = SUBMISSION_STATUS_SUBMITTED;
  record.submitted_at_ms = submitted_at_ms == 0 ? util::NowMs() : submitted_at_ms;
  record.updated_at_ms   = record.submitted_at_ms;

  auto tx  = repo.Begin();
  auto res = repo.InsertSubmission(*tx, record);
  assert(res);
  for (int i = 0; i < images; ++i) {
    db::model::SubmissionImageRecord image;
    image.submission_id = record.id;
    image.file_path     = "uploads/" + record.id + "/" + std::to_string(i) + ".jpg";
    auto img_res        = repo.InsertSubmissionImage(*tx, image);
    assert(img_res);
  }
  tx->Commit();
  return record;
}

inline db::model::RequestRecord LoadRequest(db::Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  auto r  = repo.GetRequest(*tx, id);
  tx->Commit();
  assert(r.has_value());
  return *r;
}

inline db::model::SubmissionRecord LoadSubmission(db::Repository& repo, const std::string& id) {
  auto tx = repo.Begin();
  auto s  = repo.GetSubmission(*tx, id);
  tx->Commit();
  assert(s.has_value());
  return *s;
}

// Every earning row for the request, provisional ones included.
inline std::vector<db::model::EarningRecord> EarningsFor(db::Repository& repo, const std::string& request_id) {
  db::model::EarningFilter filter;
  filter.request_id          = request_id;
  filter.include_provisional = true;
  auto tx           = repo.Begin();
  auto rows         = repo.ListEarnings(*tx, filter);
  tx->Commit();
  return rows;
}

// Counters bounded and equal to the accepted submissions; one earning per acceptance, none otherwise.
inline void AssertLedgerConsistent(db::Repository& repo, const std::string& request_id) {
  const auto request = LoadRequest(repo, request_id);
  assert(request.budget_spent_cents >= 0 && request.budget_spent_cents <= request.budget_total_cents);
  assert(request.quantity_fulfilled >= 0 && request.quantity_fulfilled <= request.quantity_needed);

  db::model::SubmissionFilter filter;
  filter.request_id = request_id;
  auto tx           = repo.Begin();
  auto submissions  = repo.ListSubmissions(*tx, filter);
  tx->Commit();

  const auto earnings = EarningsFor(repo, request_id);

  int64_t accepted_cents = 0;
  int64_t accepted_count = 0;
  for (const auto& s : submissions) {
    std::size_t matching = 0;
    for (const auto& e : earnings) {
      if (e.submission_id == s.id) {
        ++matching;
        if (s.status == SUBMISSION_STATUS_ACCEPTED) {
          assert(e.id == s.earning_id);
          assert(e.amount_cents == s.earned_amount_cents + s.bonus_amount_cents);
        }
      }
    }
    if (s.status == SUBMISSION_STATUS_ACCEPTED) {
      assert(matching == 1);
      accepted_cents += s.earned_amount_cents + s.bonus_amount_cents;
      ++accepted_count;
    } else {
      assert(matching == 0);
    }
  }
  assert(request.budget_spent_cents == accepted_cents);
  assert(request.quantity_fulfilled == accepted_count);
}

class RecordingNotifier final : public notify::Notifier {
 public:
  void Notify(const notify::Notification& notification) override {
    std::lock_guard<std::mutex> lock(mutex_);
    sent_.push_back(notification);
  }

  std::vector<notify::Notification> Sent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
  }

 private:
  mutable std::mutex                mutex_;
  std::vector<notify::Notification> sent_;
};

/*
  Passes every call through to an inner repository. Tests override the
  calls they want to fail or pause.
*/
class ForwardingRepository : public db::Repository {
 public:
  explicit ForwardingRepository(std::shared_ptr<db::Repository> inner = std::make_shared<db::memory::MemoryRepository>())
      : inner_(std::move(inner)) {
  }

  db::Repository& Inner() {
    return *inner_;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertRequest(db::Transaction& tx, db::model::RequestRecord& r) override {
    return inner_->InsertRequest(tx, r);
  }
  std::optional<db::model::RequestRecord> GetRequest(db::Transaction& tx, const std::string& id) override {
    return inner_->GetRequest(tx, id);
  }
  std::vector<db::model::RequestRecord> ListRequests(db::Transaction& tx, std::optional<RequestStatus> status) override {
    return inner_->ListRequests(tx, status);
  }
  db::Result TransitionRequestIf(db::Transaction& tx, const db::model::RequestStatusChange& c) override {
    return inner_->TransitionRequestIf(tx, c);
  }
  db::Result SwapRequestCounters(db::Transaction& tx, const db::model::RequestCounterSwap& s) override {
    return inner_->SwapRequestCounters(tx, s);
  }

  db::Result InsertSubmission(db::Transaction& tx, db::model::SubmissionRecord& s) override {
    return inner_->InsertSubmission(tx, s);
  }
  std::optional<db::model::SubmissionRecord> GetSubmission(db::Transaction& tx, const std::string& id) override {
    return inner_->GetSubmission(tx, id);
  }
  std::vector<db::model::SubmissionRecord> ListSubmissions(db::Transaction& tx, const db::model::SubmissionFilter& f) override {
    return inner_->ListSubmissions(tx, f);
  }
  db::Result ReviewSubmissionIf(db::Transaction& tx, const db::model::SubmissionReview& r) override {
    return inner_->ReviewSubmissionIf(tx, r);
  }
  db::Result InsertSubmissionImage(db::Transaction& tx, db::model::SubmissionImageRecord& i) override {
    return inner_->InsertSubmissionImage(tx, i);
  }
  uint64_t CountSubmissionImages(db::Transaction& tx, const std::string& id) override {
    return inner_->CountSubmissionImages(tx, id);
  }

  db::Result InsertEarning(db::Transaction& tx, db::model::EarningRecord& e) override {
    return inner_->InsertEarning(tx, e);
  }
  std::optional<db::model::EarningRecord> GetEarning(db::Transaction& tx, const std::string& id) override {
    return inner_->GetEarning(tx, id);
  }
  std::vector<db::model::EarningRecord> ListEarnings(db::Transaction& tx, const db::model::EarningFilter& f) override {
    return inner_->ListEarnings(tx, f);
  }
  uint64_t CountEarnings(db::Transaction& tx, std::optional<EarningStatus> status) override {
    return inner_->CountEarnings(tx, status);
  }
  db::Result UpdateEarningStatusIf(db::Transaction& tx, const db::model::EarningStatusChange& c) override {
    return inner_->UpdateEarningStatusIf(tx, c);
  }
  db::Result DeleteProvisionalEarning(db::Transaction& tx, const std::string& id) override {
    return inner_->DeleteProvisionalEarning(tx, id);
  }
  std::vector<db::model::EarningTotal> SumEarningsByStatus(db::Transaction& tx) override {
    return inner_->SumEarningsByStatus(tx);
  }

  db::Result AppendActivity(db::Transaction& tx, db::model::ActivityRecord& a) override {
    return inner_->AppendActivity(tx, a);
  }
  std::vector<db::model::ActivityRecord> ListActivity(db::Transaction& tx, const std::string& contributor_id, std::size_t limit) override {
    return inner_->ListActivity(tx, contributor_id, limit);
  }

 private:
  std::shared_ptr<db::Repository> inner_;
};

} // namespace bounty::testing
