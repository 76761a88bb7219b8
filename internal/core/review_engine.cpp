#include "review_engine.hpp"

#include <stdexcept>
#include <thread>

#include "internal/core/store_errors.hpp"
#include "internal/model/request_lifecycle.hpp"
#include "internal/model/review_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/money.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace bounty::core {

using namespace bounty::ledger::v1;
using observability::IntField;
using observability::MoneyField;
using observability::StringField;

namespace {

constexpr std::size_t kFeedbackMax = 2000;

std::size_t CodePoints(const std::string& text) {
  std::size_t n = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

const char* OutcomeLabel(const std::exception& e) {
  if (dynamic_cast<const util::NotFound*>(&e)) return "not_found";
  if (dynamic_cast<const util::InvalidArgument*>(&e)) return "invalid_argument";
  if (dynamic_cast<const util::PermissionDenied*>(&e)) return "permission_denied";
  if (dynamic_cast<const util::NotReviewable*>(&e)) return "not_reviewable";
  if (dynamic_cast<const util::BudgetExceeded*>(&e)) return "budget_exceeded";
  if (dynamic_cast<const util::ConcurrentModification*>(&e)) return "conflict";
  if (dynamic_cast<const util::AcceptanceStranded*>(&e)) return "stranded";
  if (dynamic_cast<const util::StoreUnavailable*>(&e)) return "store_unavailable";
  return "error";
}

struct ReviewSnapshot {
  db::model::SubmissionRecord submission;
  db::model::RequestRecord    request;
  uint64_t                    image_count = 0;
};

} // namespace

ReviewEngine::ReviewEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::Notifier> notifier, auth::HasRoleFn has_role,
                           ReviewEngineOptions options)
    : repository_(std::move(repository)), notifier_(std::move(notifier)), has_role_(std::move(has_role)), options_(options) {
  if (options_.compensation_max_attempts == 0) options_.compensation_max_attempts = 1;
}

ReviewOutcome ReviewEngine::Review(const ReviewDecision& decision, const std::string& actor) {
  const auto action = std::string(model::ToString(decision.action));
  if (model::OutcomeStatus(decision.action) == SUBMISSION_STATUS_UNSPECIFIED) {
    throw util::InvalidArgument("review action must be accept, reject or revision_requested");
  }

  auth::RequireRole(has_role_, actor, decision.action == REVIEW_ACTION_ACCEPT ? ADMIN_ROLE_ADMIN : ADMIN_ROLE_REVIEWER, action + " submission");

  if (!util::IsCanonicalUuid(decision.submission_id)) {
    throw util::InvalidArgument("submission id must be a UUID");
  }
  if (CodePoints(decision.feedback) > kFeedbackMax) {
    throw util::InvalidArgument("feedback must be at most 2000 characters");
  }

  observability::SpanScope span("bounty.review");
  span.SetAttribute("submission_id", decision.submission_id);
  span.SetAttribute("action", action);

  try {
    auto outcome = decision.action == REVIEW_ACTION_ACCEPT ? Accept(decision, actor) : Decline(decision, actor);
    observability::Metrics::Instance().RecordReviewOutcome(action, model::ToString(outcome.submission.status));
    return outcome;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordReviewOutcome(action, OutcomeLabel(e));
    throw;
  }
}

ReviewOutcome ReviewEngine::Accept(const ReviewDecision& decision, const std::string& actor) {
  // 1. snapshot
  ReviewSnapshot snap;
  {
    auto tx  = repository_->Begin();
    auto sub = repository_->GetSubmission(*tx, decision.submission_id);
    if (!sub) throw util::NotFound("submission not found: " + decision.submission_id);
    if (!model::IsAwaitingReview(sub->status)) {
      throw util::NotReviewable("submission is already " + std::string(model::ToString(sub->status)));
    }

    auto req = repository_->GetRequest(*tx, sub->request_id);
    if (!req) throw util::NotFound("request not found: " + sub->request_id);
    if (!model::IsReviewable(req->status)) {
      throw util::NotReviewable("request is " + std::string(model::ToString(req->status)));
    }
    if (req->quantity_fulfilled >= req->quantity_needed) {
      throw util::NotReviewable("request already has all " + std::to_string(req->quantity_needed) + " submissions it needs");
    }

    snap.image_count = repository_->CountSubmissionImages(*tx, sub->id);
    tx->Commit();
    snap.submission = std::move(*sub);
    snap.request    = std::move(*req);
  }
  const auto& request = snap.request;

  // 2. payout
  const auto payout = ComputePayout(request, snap.submission, snap.image_count, decision.award_quality_bonus);

  // 3. provisional earning
  db::model::EarningRecord earning;
  earning.id                 = util::NewId();
  earning.contributor_id     = snap.submission.contributor_id;
  earning.submission_id      = snap.submission.id;
  earning.request_id         = request.id;
  earning.amount_cents       = payout.total_cents;
  earning.bonus_amount_cents = payout.bonus_cents;
  earning.status             = EARNING_STATUS_PENDING;
  earning.description        = "Bounty: " + request.title;
  earning.created_at_ms      = util::NowMs();
  {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertEarning(*tx, earning), "insert provisional earning");
    tx->Commit();
  }
  BOUNTY_LOG_DEBUG("provisional earning inserted", {StringField("earning_id", earning.id), StringField("submission_id", earning.submission_id),
                                                    MoneyField("amount", earning.amount_cents)});

  // 4. new counters
  int64_t new_spent = 0;
  try {
    new_spent = util::CheckedAdd(request.budget_spent_cents, payout.total_cents);
  } catch (const util::InvalidArgument&) {
    Compensate(earning, "overflow");
    throw;
  }
  const int64_t new_fulfilled = request.quantity_fulfilled + 1;

  // 5. budget
  if (new_spent > request.budget_total_cents) {
    BOUNTY_LOG_WARN("acceptance exceeds budget",
                    {StringField("request_id", request.id), StringField("submission_id", earning.submission_id),
                     MoneyField("payout", payout.total_cents), MoneyField("remaining", request.budget_total_cents - request.budget_spent_cents)});
    Compensate(earning, "budget_exceeded");
    throw util::BudgetExceeded("payout of " + util::FormatUsd(payout.total_cents) + " exceeds the remaining budget of " +
                               util::FormatUsd(request.budget_total_cents - request.budget_spent_cents));
  }

  // 6. compare-and-swap
  db::model::RequestCounterSwap swap;
  swap.id                          = request.id;
  swap.expected_version            = request.version;
  swap.expected_budget_spent_cents = request.budget_spent_cents;
  swap.expected_quantity_fulfilled = request.quantity_fulfilled;
  swap.new_budget_spent_cents      = new_spent;
  swap.new_quantity_fulfilled      = new_fulfilled;
  if (new_fulfilled >= request.quantity_needed) swap.new_status = REQUEST_STATUS_FULFILLED;
  swap.updated_at_ms = util::NowMs();

  db::Result swap_result;
  bool       committing = false;
  try {
    auto tx     = repository_->Begin();
    swap_result = repository_->SwapRequestCounters(*tx, swap);
    if (swap_result) {
      committing = true;
      tx->Commit();
    } else {
      tx->Rollback();
    }
  } catch (const util::StoreUnavailable& e) {
    if (committing) {
      // Commit outcome unknown; reconciliation decides whether the earning is stranded or orphaned.
      BOUNTY_LOG_ERROR("counter update outcome unknown; earning left for reconciliation",
                       {StringField("request_id", request.id), StringField("earning_id", earning.id), StringField("error", e.what())});
      throw;
    }
    Compensate(earning, "store_error");
    throw;
  } catch (const std::exception&) {
    // Begin/commit failed; the swap did not land.
    Compensate(earning, "store_error");
    throw;
  }

  // 7. lost the race
  if (!swap_result) {
    if (swap_result.code == db::ErrorCode::Conflict) {
      BOUNTY_LOG_WARN("request counters changed during review",
                      {StringField("request_id", request.id), StringField("submission_id", earning.submission_id),
                       IntField("expected_version", static_cast<int64_t>(request.version))});
      Compensate(earning, "conflict");
      throw util::ConcurrentModification("request " + request.id + " changed during review; reload and retry");
    }
    Compensate(earning, "store_error");
    ThrowIfDbError(swap_result, "update request counters");
  }

  // 8. finalize
  db::model::SubmissionRecord accepted;
  try {
    accepted = CompleteAcceptance(earning, actor, decision.feedback);
  } catch (const std::exception& e) {
    BOUNTY_LOG_ERROR("acceptance stranded after counter update",
                     {StringField("submission_id", earning.submission_id), StringField("earning_id", earning.id),
                      StringField("request_id", request.id), StringField("error", e.what())});
    throw util::AcceptanceStranded("submission " + earning.submission_id + " debited request " + request.id +
                                   " but was not marked accepted: " + e.what());
  }

  if (swap.new_status) {
    BOUNTY_LOG_INFO("request fulfilled", {StringField("request_id", request.id), IntField("quantity_fulfilled", new_fulfilled)});
  }
  BOUNTY_LOG_INFO("submission accepted", {StringField("submission_id", accepted.id), StringField("request_id", request.id),
                                          StringField("earning_id", earning.id), MoneyField("total_payout", payout.total_cents),
                                          StringField("actor", actor)});

  NotifyContributor(notify::Notification{earning.contributor_id,
                                         notify::kSubmissionAccepted,
                                         notify::AcceptedMessage(payout.total_cents),
                                         {{"submission_id", accepted.id},
                                          {"request_id", request.id},
                                          {"earning_id", earning.id},
                                          {"total_payout", util::FormatUsd(payout.total_cents)}}});

  ReviewOutcome outcome;
  outcome.submission = std::move(accepted);
  outcome.earning    = std::move(earning);
  outcome.payout     = payout;
  return outcome;
}

db::model::SubmissionRecord ReviewEngine::CompleteAcceptance(const db::model::EarningRecord& earning, const std::string& reviewed_by,
                                                             const std::string& feedback) {
  db::model::SubmissionReview review;
  review.id                  = earning.submission_id;
  review.from                = model::AwaitingReviewStatuses();
  review.to                  = SUBMISSION_STATUS_ACCEPTED;
  review.reviewed_by         = reviewed_by;
  review.reviewed_at_ms      = util::NowMs();
  review.review_feedback     = feedback;
  review.earned_amount_cents = earning.amount_cents - earning.bonus_amount_cents;
  review.bonus_amount_cents  = earning.bonus_amount_cents;
  review.earning_id          = earning.id;
  review.updated_at_ms       = review.reviewed_at_ms;

  std::string last_error;
  for (uint32_t attempt = 1; attempt <= options_.compensation_max_attempts; ++attempt) {
    try {
      auto tx  = repository_->Begin();
      auto res = repository_->ReviewSubmissionIf(*tx, review);
      if (res) {
        auto updated = repository_->GetSubmission(*tx, review.id);
        tx->Commit();
        if (!updated) throw std::runtime_error("accept submission: row vanished after update");
        return *updated;
      }

      if (res.code == db::ErrorCode::Conflict) {
        auto current = repository_->GetSubmission(*tx, review.id);
        tx->Rollback();
        if (current && current->status == SUBMISSION_STATUS_ACCEPTED && current->earning_id == earning.id) {
          return *current; // already completed
        }
        throw util::ConcurrentModification("submission " + review.id + " cannot be accepted against earning " + earning.id);
      }

      tx->Rollback();
      if (!res.IsTransient()) ThrowIfDbError(res, "accept submission");
      last_error = res.message;
    } catch (const util::StoreUnavailable& e) {
      last_error = e.what();
    }

    if (attempt < options_.compensation_max_attempts) {
      std::this_thread::sleep_for(options_.compensation_backoff * attempt);
    }
  }
  throw util::StoreUnavailable("accept submission " + review.id + ": " + last_error);
}

ReviewOutcome ReviewEngine::Decline(const ReviewDecision& decision, const std::string& actor) {
  {
    auto tx  = repository_->Begin();
    auto sub = repository_->GetSubmission(*tx, decision.submission_id);
    if (!sub) throw util::NotFound("submission not found: " + decision.submission_id);
    if (!model::IsAwaitingReview(sub->status)) {
      throw util::NotReviewable("submission is already " + std::string(model::ToString(sub->status)));
    }
    auto req = repository_->GetRequest(*tx, sub->request_id);
    if (!req) throw util::NotFound("request not found: " + sub->request_id);
    if (!model::IsReviewable(req->status)) {
      throw util::NotReviewable("request is " + std::string(model::ToString(req->status)));
    }
    tx->Commit();
  }

  db::model::SubmissionReview review;
  review.id              = decision.submission_id;
  review.from            = model::AwaitingReviewStatuses();
  review.to              = model::OutcomeStatus(decision.action);
  review.reviewed_by     = actor;
  review.reviewed_at_ms  = util::NowMs();
  review.review_feedback = decision.feedback;
  review.updated_at_ms   = review.reviewed_at_ms;

  db::model::SubmissionRecord updated;
  {
    auto tx  = repository_->Begin();
    auto res = repository_->ReviewSubmissionIf(*tx, review);
    if (res.code == db::ErrorCode::Conflict) {
      auto current = repository_->GetSubmission(*tx, review.id);
      tx->Rollback();
      if (!current) throw util::NotFound("submission not found: " + review.id);
      if (!model::IsAwaitingReview(current->status)) {
        throw util::NotReviewable("submission is already " + std::string(model::ToString(current->status)));
      }
      throw util::ConcurrentModification("an acceptance is in progress for submission " + review.id);
    }
    ThrowIfDbError(res, "review submission");

    auto row = repository_->GetSubmission(*tx, review.id);
    if (!row) throw std::runtime_error("review submission: row vanished after update");
    tx->Commit();
    updated = std::move(*row);
  }

  const bool rejected = decision.action == REVIEW_ACTION_REJECT;
  BOUNTY_LOG_INFO(rejected ? "submission rejected" : "submission revision requested",
                  {StringField("submission_id", updated.id), StringField("request_id", updated.request_id), StringField("actor", actor)});

  NotifyContributor(notify::Notification{updated.contributor_id,
                                         rejected ? notify::kSubmissionRejected : notify::kSubmissionRevisionRequested,
                                         rejected ? notify::RejectedMessage() : notify::RevisionRequestedMessage(),
                                         {{"submission_id", updated.id}, {"request_id", updated.request_id}, {"feedback", updated.review_feedback}}});

  ReviewOutcome outcome;
  outcome.submission = std::move(updated);
  return outcome;
}

bool ReviewEngine::Compensate(const db::model::EarningRecord& earning, const char* reason) {
  std::string last_error;
  for (uint32_t attempt = 1; attempt <= options_.compensation_max_attempts; ++attempt) {
    bool retryable = true;
    try {
      auto tx  = repository_->Begin();
      auto res = repository_->DeleteProvisionalEarning(*tx, earning.id);
      if (res) {
        tx->Commit();
        BOUNTY_LOG_INFO("provisional earning compensated",
                        {StringField("earning_id", earning.id), StringField("reason", reason), IntField("attempt", attempt)});
        observability::Metrics::Instance().RecordCompensation(reason, false);
        return true;
      }
      tx->Rollback();
      last_error = res.message;
      retryable  = res.IsTransient();
    } catch (const util::StoreUnavailable& e) {
      last_error = e.what();
    } catch (const std::exception& e) {
      last_error = e.what();
      retryable  = false;
    }

    if (!retryable) break;
    if (attempt < options_.compensation_max_attempts) {
      std::this_thread::sleep_for(options_.compensation_backoff * attempt);
    }
  }

  BOUNTY_LOG_ERROR("compensation failed; provisional earning stranded",
                   {StringField("earning_id", earning.id), StringField("submission_id", earning.submission_id),
                    StringField("request_id", earning.request_id), StringField("reason", reason), StringField("error", last_error)});
  observability::Metrics::Instance().RecordCompensation(reason, true);
  return false;
}

std::vector<db::model::SubmissionRecord> ReviewEngine::ListPending(std::size_t limit, const std::string& actor) {
  auth::RequireRole(has_role_, actor, ADMIN_ROLE_REVIEWER, "list pending submissions");

  db::model::SubmissionFilter filter;
  filter.status = SUBMISSION_STATUS_SUBMITTED;
  filter.limit  = limit;

  auto tx   = repository_->Begin();
  auto rows = repository_->ListSubmissions(*tx, filter);
  tx->Commit();
  return rows;
}

void ReviewEngine::NotifyContributor(const notify::Notification& notification) {
  if (!notifier_) return;
  try {
    notifier_->Notify(notification);
  } catch (const std::exception& e) {
    BOUNTY_LOG_WARN("contributor notification failed", {StringField("contributor_id", notification.contributor_id),
                                                        StringField("event", notification.event_kind), StringField("error", e.what())});
  }
}

} // namespace bounty::core
