#include "earnings_ledger.hpp"

#include <algorithm>

#include "internal/core/store_errors.hpp"
#include "internal/model/review_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace bounty::core {

using namespace bounty::ledger::v1;
using observability::StringField;

namespace {

constexpr uint32_t kDefaultPageSize = 50;
constexpr uint32_t kMaxPageSize     = 500;

} // namespace

EarningsLedger::EarningsLedger(std::shared_ptr<db::Repository> repository, auth::HasRoleFn has_role)
    : repository_(std::move(repository)), has_role_(std::move(has_role)) {
}

PayoutStats EarningsLedger::GetPayoutStats(const std::string& actor) {
  auth::RequireRole(has_role_, actor, ADMIN_ROLE_ADMIN, "read payout stats");

  auto tx     = repository_->Begin();
  auto totals = repository_->SumEarningsByStatus(*tx);
  tx->Commit();

  PayoutStats stats;
  for (const auto& t : totals) {
    switch (t.status) {
      case EARNING_STATUS_PENDING:
        stats.pending_cents = t.amount_cents;
        stats.pending_count = t.count;
        break;
      case EARNING_STATUS_PROCESSING:
        stats.processing_cents = t.amount_cents;
        break;
      case EARNING_STATUS_PAID:
        stats.paid_cents = t.amount_cents;
        break;
      case EARNING_STATUS_HELD:
        stats.held_cents = t.amount_cents;
        break;
      default:
        break;
    }
  }
  return stats;
}

AdminStats EarningsLedger::GetAdminStats(const std::string& actor) {
  auth::RequireRole(has_role_, actor, ADMIN_ROLE_REVIEWER, "read admin stats");

  auto tx       = repository_->Begin();
  auto requests = repository_->ListRequests(*tx, std::nullopt);

  db::model::SubmissionFilter pending;
  pending.status   = SUBMISSION_STATUS_SUBMITTED;
  auto pending_sub = repository_->ListSubmissions(*tx, pending);
  auto all_sub     = repository_->ListSubmissions(*tx, db::model::SubmissionFilter{});
  tx->Commit();

  AdminStats stats;
  stats.total_requests = requests.size();
  for (const auto& r : requests) {
    switch (r.status) {
      case REQUEST_STATUS_DRAFT:
        ++stats.draft_requests;
        break;
      case REQUEST_STATUS_PUBLISHED:
        ++stats.published_requests;
        break;
      case REQUEST_STATUS_PAUSED:
        ++stats.paused_requests;
        break;
      case REQUEST_STATUS_FULFILLED:
        ++stats.fulfilled_requests;
        break;
      default:
        break;
    }
    stats.budget_total_cents += r.budget_total_cents;
    stats.budget_spent_cents += r.budget_spent_cents;
  }
  stats.pending_reviews   = pending_sub.size();
  stats.total_submissions = all_sub.size();
  return stats;
}

EarningsPage EarningsLedger::ListEarnings(std::optional<EarningStatus> status, uint32_t page, uint32_t page_size, const std::string& actor) {
  auth::RequireRole(has_role_, actor, ADMIN_ROLE_ADMIN, "list earnings");

  if (status && *status == EARNING_STATUS_UNSPECIFIED) status.reset();
  if (page == 0) page = 1;
  if (page_size == 0) page_size = kDefaultPageSize;
  page_size = std::min(page_size, kMaxPageSize);

  db::model::EarningFilter filter;
  filter.status = status;
  filter.limit  = page_size;
  filter.offset = static_cast<std::size_t>(page - 1) * page_size;

  EarningsPage result;
  auto         tx = repository_->Begin();
  result.earnings = repository_->ListEarnings(*tx, filter);
  result.total    = repository_->CountEarnings(*tx, status);
  tx->Commit();
  return result;
}

db::model::EarningRecord EarningsLedger::UpdateEarningStatus(const std::string& earning_id, EarningStatus to, const std::string& actor) {
  auth::RequireRole(has_role_, actor, ADMIN_ROLE_ADMIN, "update earning status");

  if (!util::IsCanonicalUuid(earning_id)) {
    throw util::InvalidArgument("earning id must be a UUID");
  }
  const auto& sources = model::EarningSourcesFor(to);
  if (sources.empty()) {
    throw util::InvalidArgument("earnings cannot be moved to " + std::string(model::ToString(to)));
  }

  db::model::EarningStatusChange change;
  change.id   = earning_id;
  change.from = sources;
  change.to   = to;
  if (to == EARNING_STATUS_PAID) change.paid_at_ms = util::NowMs();

  auto tx  = repository_->Begin();
  auto res = repository_->UpdateEarningStatusIf(*tx, change);
  if (res.code == db::ErrorCode::Conflict) {
    auto current = repository_->GetEarning(*tx, earning_id);
    auto claimer = current ? repository_->GetSubmission(*tx, current->submission_id) : std::nullopt;
    tx->Rollback();
    // A provisional earning belongs to an acceptance still in flight.
    if (!current || !claimer || claimer->status != SUBMISSION_STATUS_ACCEPTED || claimer->earning_id != earning_id) {
      throw util::NotFound("earning not found: " + earning_id);
    }
    throw util::InvalidTransition("cannot move earning from " + std::string(model::ToString(current->status)) + " to " +
                                  std::string(model::ToString(to)));
  }
  ThrowIfDbError(res, "update earning status");

  auto updated = repository_->GetEarning(*tx, earning_id);
  if (!updated) throw std::runtime_error("update earning status: row vanished after update");
  tx->Commit();

  BOUNTY_LOG_INFO("earning status updated",
                  {StringField("earning_id", earning_id), StringField("status", model::ToString(to)), StringField("actor", actor)});
  return *updated;
}

} // namespace bounty::core
