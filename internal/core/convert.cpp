#include "convert.hpp"

namespace bounty::core {

using namespace bounty::ledger::v1;

BountyRequest ToProto(const db::model::RequestRecord& r) {
  BountyRequest out;
  out.set_id(r.id);
  out.set_created_by(r.created_by);
  out.set_title(r.title);
  out.set_description(r.description);
  out.set_status(r.status);
  out.set_pay_type(r.pay_type);
  out.set_pay_amount_cents(r.pay_amount_cents);
  out.set_speed_bonus_cents(r.speed_bonus_cents);
  out.set_speed_bonus_deadline_ms(r.speed_bonus_deadline_ms.value_or(0));
  out.set_quality_bonus_cents(r.quality_bonus_cents);
  out.set_budget_total_cents(r.budget_total_cents);
  out.set_budget_spent_cents(r.budget_spent_cents);
  out.set_quantity_needed(r.quantity_needed);
  out.set_quantity_fulfilled(r.quantity_fulfilled);
  out.set_published_at_ms(r.published_at_ms);
  out.set_reviewed_by(r.reviewed_by);
  out.set_reviewed_at_ms(r.reviewed_at_ms);
  out.set_created_at_ms(r.created_at_ms);
  out.set_updated_at_ms(r.updated_at_ms);
  out.set_version(r.version);
  return out;
}

BountySubmission ToProto(const db::model::SubmissionRecord& r) {
  BountySubmission out;
  out.set_id(r.id);
  out.set_request_id(r.request_id);
  out.set_contributor_id(r.contributor_id);
  out.set_status(r.status);
  out.set_submitted_at_ms(r.submitted_at_ms);
  out.set_reviewed_by(r.reviewed_by);
  out.set_reviewed_at_ms(r.reviewed_at_ms);
  out.set_review_feedback(r.review_feedback);
  out.set_earned_amount_cents(r.earned_amount_cents);
  out.set_bonus_amount_cents(r.bonus_amount_cents);
  out.set_earning_id(r.earning_id);
  out.set_updated_at_ms(r.updated_at_ms);
  return out;
}

Earning ToProto(const db::model::EarningRecord& r) {
  Earning out;
  out.set_id(r.id);
  out.set_contributor_id(r.contributor_id);
  out.set_submission_id(r.submission_id);
  out.set_request_id(r.request_id);
  out.set_amount_cents(r.amount_cents);
  out.set_bonus_amount_cents(r.bonus_amount_cents);
  out.set_currency(r.currency);
  out.set_status(r.status);
  out.set_description(r.description);
  out.set_paid_at_ms(r.paid_at_ms);
  out.set_created_at_ms(r.created_at_ms);
  return out;
}

} // namespace bounty::core
