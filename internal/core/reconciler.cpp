#include "reconciler.hpp"

#include <unordered_map>

#include "internal/core/store_errors.hpp"
#include "internal/model/review_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace bounty::core {

using namespace bounty::ledger::v1;
using observability::IntField;
using observability::MoneyField;
using observability::StringField;

namespace {

struct RequestSnapshot {
  db::model::RequestRecord                 request;
  std::vector<db::model::SubmissionRecord> submissions;
  std::vector<db::model::EarningRecord>    earnings;
};

} // namespace

Reconciler::Reconciler(std::shared_ptr<db::Repository> repository, std::shared_ptr<ReviewEngine> engine, auth::HasRoleFn has_role)
    : repository_(std::move(repository)), engine_(std::move(engine)), has_role_(std::move(has_role)) {
}

ReconcileReport Reconciler::Reconcile(uint64_t grace_period_ms, bool repair, const std::string& actor) {
  auth::RequireRole(has_role_, actor, ADMIN_ROLE_SUPER_ADMIN, "reconcile");

  observability::SpanScope span("bounty.reconcile");
  span.SetAttribute("repair", static_cast<std::int64_t>(repair));

  const int64_t cutoff = util::NowMs() - static_cast<int64_t>(grace_period_ms);

  std::vector<db::model::RequestRecord> requests;
  {
    auto tx  = repository_->Begin();
    requests = repository_->ListRequests(*tx, std::nullopt);
    tx->Commit();
  }

  ReconcileReport report;
  for (const auto& listed : requests) {
    RequestSnapshot snap;
    {
      auto tx = repository_->Begin();
      auto r  = repository_->GetRequest(*tx, listed.id);
      if (!r) {
        tx->Rollback();
        continue;
      }
      snap.request = std::move(*r);

      db::model::SubmissionFilter sf;
      sf.request_id    = snap.request.id;
      snap.submissions = repository_->ListSubmissions(*tx, sf);

      db::model::EarningFilter ef;
      ef.request_id          = snap.request.id;
      ef.include_provisional = true;
      snap.earnings = repository_->ListEarnings(*tx, ef);
      tx->Commit();
    }

    std::unordered_map<std::string, const db::model::SubmissionRecord*> by_id;
    int64_t                                                             accepted_cents = 0;
    int64_t                                                             accepted_count = 0;
    for (const auto& s : snap.submissions) {
      by_id.emplace(s.id, &s);
      if (s.status == SUBMISSION_STATUS_ACCEPTED) {
        accepted_cents += s.earned_amount_cents + s.bonus_amount_cents;
        ++accepted_count;
      }
    }

    std::vector<const db::model::EarningRecord*> unclaimed;
    bool                                         in_flight = false;
    int64_t                                      unclaimed_cents = 0;
    for (const auto& e : snap.earnings) {
      auto it = by_id.find(e.submission_id);
      if (it == by_id.end() || !model::IsAwaitingReview(it->second->status)) continue;
      if (e.created_at_ms > cutoff) {
        in_flight = true;
        break;
      }
      unclaimed.push_back(&e);
      unclaimed_cents += e.amount_cents;
    }
    if (in_flight) {
      BOUNTY_LOG_DEBUG("reconcile skipped request with acceptance in flight", {StringField("request_id", snap.request.id)});
      continue;
    }

    const int64_t drift_cents = snap.request.budget_spent_cents - accepted_cents;
    const int64_t drift_count = snap.request.quantity_fulfilled - accepted_count;

    if (unclaimed.empty()) {
      if (drift_cents != 0 || drift_count != 0) {
        BOUNTY_LOG_WARN("request counters drifted", {StringField("request_id", snap.request.id), MoneyField("drift", drift_cents),
                                                     IntField("drift_count", drift_count)});
        report.drifted_request_ids.push_back(snap.request.id);
      }
      continue;
    }

    if (drift_cents == unclaimed_cents && drift_count == static_cast<int64_t>(unclaimed.size())) {
      for (const auto* e : unclaimed) {
        BOUNTY_LOG_WARN("stranded acceptance found", {StringField("submission_id", e->submission_id), StringField("earning_id", e->id),
                                                      StringField("request_id", snap.request.id)});
        report.stranded_submission_ids.push_back(e->submission_id);
        if (!repair) continue;
        try {
          engine_->CompleteAcceptance(*e, actor, "");
          ++report.repaired;
        } catch (const std::exception& ex) {
          BOUNTY_LOG_ERROR("stranded acceptance repair failed", {StringField("submission_id", e->submission_id), StringField("error", ex.what())});
        }
      }
    } else if (drift_cents == 0 && drift_count == 0) {
      for (const auto* e : unclaimed) {
        BOUNTY_LOG_WARN("orphan earning found", {StringField("earning_id", e->id), StringField("submission_id", e->submission_id),
                                                 MoneyField("amount", e->amount_cents)});
        report.orphan_earning_ids.push_back(e->id);
      }
      if (repair) report.repaired += DeleteOrphans(snap.request, unclaimed);
    } else {
      BOUNTY_LOG_WARN("request counters drifted", {StringField("request_id", snap.request.id), MoneyField("drift", drift_cents),
                                                   IntField("drift_count", drift_count), MoneyField("unclaimed", unclaimed_cents)});
      report.drifted_request_ids.push_back(snap.request.id);
    }
  }

  BOUNTY_LOG_INFO("reconcile finished", {IntField("stranded", static_cast<int64_t>(report.stranded_submission_ids.size())),
                                         IntField("orphans", static_cast<int64_t>(report.orphan_earning_ids.size())),
                                         IntField("drifted", static_cast<int64_t>(report.drifted_request_ids.size())),
                                         IntField("repaired", static_cast<int64_t>(report.repaired)), StringField("actor", actor)});
  return report;
}

/*
  Orphans are deleted in the same transaction as a no-op counter swap
  against the snapshot. The swap bumps the request version, so a review
  that inserted one of these earnings and has not yet swapped loses its
  own compare-and-swap instead of debiting the budget for a deleted row.
  If the counters moved since the snapshot nothing is deleted.
*/
std::size_t Reconciler::DeleteOrphans(const db::model::RequestRecord& request, const std::vector<const db::model::EarningRecord*>& orphans) {
  db::model::RequestCounterSwap fence;
  fence.id                          = request.id;
  fence.expected_version            = request.version;
  fence.expected_budget_spent_cents = request.budget_spent_cents;
  fence.expected_quantity_fulfilled = request.quantity_fulfilled;
  fence.new_budget_spent_cents      = request.budget_spent_cents;
  fence.new_quantity_fulfilled      = request.quantity_fulfilled;
  fence.updated_at_ms               = util::NowMs();

  try {
    auto tx  = repository_->Begin();
    auto res = repository_->SwapRequestCounters(*tx, fence);
    if (res.code == db::ErrorCode::Conflict) {
      tx->Rollback();
      BOUNTY_LOG_INFO("orphan repair skipped; request changed since snapshot", {StringField("request_id", request.id)});
      return 0;
    }
    ThrowIfDbError(res, "fence request counters");

    for (const auto* e : orphans) {
      res = repository_->DeleteProvisionalEarning(*tx, e->id);
      if (res.code == db::ErrorCode::Conflict) {
        tx->Rollback();
        BOUNTY_LOG_INFO("orphan repair skipped; earning was claimed", {StringField("request_id", request.id), StringField("earning_id", e->id)});
        return 0;
      }
      ThrowIfDbError(res, "delete orphan earning");
    }
    tx->Commit();
    return orphans.size();
  } catch (const std::exception& ex) {
    BOUNTY_LOG_ERROR("orphan earning repair failed", {StringField("request_id", request.id), StringField("error", ex.what())});
    return 0;
  }
}

} // namespace bounty::core
