#include "bounty_admin_service.hpp"

#include <chrono>
#include <optional>

#include "internal/core/convert.hpp"
#include "internal/core/earnings_ledger.hpp"
#include "internal/core/payout_calculator.hpp"
#include "internal/core/reconciler.hpp"
#include "internal/core/request_manager.hpp"
#include "internal/core/review_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace bounty::service {

using namespace bounty::ledger::v1;
using observability::StringField;

namespace {

constexpr uint32_t kDefaultPendingLimit = 100;

template <typename Fn>
auto ObserveRpc(std::string_view route, const std::string& actor, Fn&& fn) {
  observability::SpanScope span(route);
  span.SetAttribute("admin.id", actor);

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&started_at] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    auto result = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    BOUNTY_LOG_ERROR("RPC failed", {StringField("route", route), StringField("actor", actor), StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

template <typename Status>
std::optional<Status> OptionalStatus(Status status) {
  if (static_cast<int>(status) == 0) return std::nullopt;
  return status;
}

} // namespace

BountyAdminService::BountyAdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RequestResponse BountyAdminService::CreateRequest(const CreateRequestRequest& req, const std::string& actor) {
  return ObserveRpc("BountyAdminService.CreateRequest", actor, [&] {
    core::NewRequest fields;
    fields.title               = req.title();
    fields.description         = req.description();
    fields.pay_type            = req.pay_type();
    fields.pay_amount_cents    = req.pay_amount_cents();
    fields.speed_bonus_cents   = req.speed_bonus_cents();
    fields.quality_bonus_cents = req.quality_bonus_cents();
    fields.budget_total_cents  = req.budget_total_cents();
    fields.quantity_needed     = req.quantity_needed();
    fields.initial_status      = req.initial_status();
    if (req.speed_bonus_deadline_ms() != 0) fields.speed_bonus_deadline_ms = req.speed_bonus_deadline_ms();

    RequestResponse resp;
    *resp.mutable_request() = core::ToProto(ctx_.requests->Create(fields, actor));
    return resp;
  });
}

RequestResponse BountyAdminService::TransitionRequest(const RequestTransitionRequest& req, const std::string& actor) {
  return ObserveRpc("BountyAdminService.TransitionRequest", actor, [&] {
    RequestResponse resp;
    *resp.mutable_request() = core::ToProto(ctx_.requests->Transition(req.request_id(), req.action(), actor));
    return resp;
  });
}

RequestResponse BountyAdminService::GetRequest(const GetRequestRequest& req, const std::string& actor) {
  return ObserveRpc("BountyAdminService.GetRequest", actor, [&] {
    RequestResponse resp;
    *resp.mutable_request() = core::ToProto(ctx_.requests->Get(req.request_id(), actor));
    return resp;
  });
}

ListRequestsResponse BountyAdminService::ListRequests(const ListRequestsRequest& req, const std::string& actor) {
  return ObserveRpc("BountyAdminService.ListRequests", actor, [&] {
    ListRequestsResponse resp;
    for (const auto& record : ctx_.requests->List(OptionalStatus(req.status()), actor)) {
      *resp.add_requests() = core::ToProto(record);
    }
    return resp;
  });
}

ReviewSubmissionResponse BountyAdminService::ReviewSubmission(const ReviewSubmissionRequest& req, const std::string& actor) {
  return ObserveRpc("BountyAdminService.ReviewSubmission", actor, [&] {
    core::ReviewDecision decision;
    decision.submission_id       = req.submission_id();
    decision.action              = req.action();
    decision.feedback            = req.feedback();
    decision.award_quality_bonus = req.award_quality_bonus();

    auto outcome = ctx_.reviews->Review(decision, actor);

    ReviewSubmissionResponse resp;
    *resp.mutable_submission() = core::ToProto(outcome.submission);
    if (outcome.earning) *resp.mutable_earning() = core::ToProto(*outcome.earning);
    if (outcome.payout) *resp.mutable_payout() = core::ToProto(*outcome.payout);
    return resp;
  });
}

ListPendingSubmissionsResponse BountyAdminService::ListPendingSubmissions(const ListPendingSubmissionsRequest& req, const std::string& actor) {
  return ObserveRpc("BountyAdminService.ListPendingSubmissions", actor, [&] {
    ListPendingSubmissionsResponse resp;
    const auto                     limit = req.limit() == 0 ? kDefaultPendingLimit : req.limit();
    for (const auto& record : ctx_.reviews->ListPending(limit, actor)) {
      *resp.add_submissions() = core::ToProto(record);
    }
    return resp;
  });
}

PayoutStatsResponse BountyAdminService::GetPayoutStats(const PayoutStatsRequest&, const std::string& actor) {
  return ObserveRpc("BountyAdminService.GetPayoutStats", actor, [&] {
    const auto          stats = ctx_.ledger->GetPayoutStats(actor);
    PayoutStatsResponse resp;
    resp.set_pending_cents(stats.pending_cents);
    resp.set_pending_count(stats.pending_count);
    resp.set_processing_cents(stats.processing_cents);
    resp.set_paid_cents(stats.paid_cents);
    resp.set_held_cents(stats.held_cents);
    return resp;
  });
}

ListEarningsResponse BountyAdminService::ListEarnings(const ListEarningsRequest& req, const std::string& actor) {
  return ObserveRpc("BountyAdminService.ListEarnings", actor, [&] {
    auto page = ctx_.ledger->ListEarnings(OptionalStatus(req.status()), req.page(), req.page_size(), actor);

    ListEarningsResponse resp;
    for (const auto& record : page.earnings) {
      *resp.add_earnings() = core::ToProto(record);
    }
    resp.set_total(page.total);
    return resp;
  });
}

UpdateEarningStatusResponse BountyAdminService::UpdateEarningStatus(const UpdateEarningStatusRequest& req, const std::string& actor) {
  return ObserveRpc("BountyAdminService.UpdateEarningStatus", actor, [&] {
    UpdateEarningStatusResponse resp;
    *resp.mutable_earning() = core::ToProto(ctx_.ledger->UpdateEarningStatus(req.earning_id(), req.status(), actor));
    return resp;
  });
}

AdminStatsResponse BountyAdminService::GetAdminStats(const AdminStatsRequest&, const std::string& actor) {
  return ObserveRpc("BountyAdminService.GetAdminStats", actor, [&] {
    const auto         stats = ctx_.ledger->GetAdminStats(actor);
    AdminStatsResponse resp;
    resp.set_total_requests(stats.total_requests);
    resp.set_draft_requests(stats.draft_requests);
    resp.set_published_requests(stats.published_requests);
    resp.set_paused_requests(stats.paused_requests);
    resp.set_fulfilled_requests(stats.fulfilled_requests);
    resp.set_pending_reviews(stats.pending_reviews);
    resp.set_budget_total_cents(stats.budget_total_cents);
    resp.set_budget_spent_cents(stats.budget_spent_cents);
    resp.set_total_submissions(stats.total_submissions);
    return resp;
  });
}

ReconcileResponse BountyAdminService::Reconcile(const ReconcileRequest& req, const std::string& actor) {
  return ObserveRpc("BountyAdminService.Reconcile", actor, [&] {
    const auto report = ctx_.reconciler->Reconcile(req.grace_period_ms(), req.repair(), actor);

    ReconcileResponse resp;
    for (const auto& id : report.stranded_submission_ids) resp.add_stranded_submission_ids(id);
    for (const auto& id : report.orphan_earning_ids) resp.add_orphan_earning_ids(id);
    for (const auto& id : report.drifted_request_ids) resp.add_drifted_request_ids(id);
    resp.set_repaired(report.repaired);
    return resp;
  });
}

} // namespace bounty::service
