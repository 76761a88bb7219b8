#include "request_manager.hpp"

#include <stdexcept>

#include "internal/core/store_errors.hpp"
#include "internal/model/request_lifecycle.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace bounty::core {

using namespace bounty::ledger::v1;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::size_t kTitleMin       = 5;
constexpr std::size_t kTitleMax       = 200;
constexpr std::size_t kDescriptionMin = 20;
constexpr std::size_t kDescriptionMax = 5000;
constexpr int64_t     kMinPayCents    = 100;
constexpr int64_t     kMinBudgetCents = 1000;

void RequireRequestId(const std::string& request_id) {
  if (!util::IsCanonicalUuid(request_id)) {
    throw util::InvalidArgument("request id must be a UUID");
  }
}

} // namespace

std::size_t Utf8Length(const std::string& text) {
  std::size_t n = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

void ValidateNewRequest(const NewRequest& r) {
  const auto title_len = Utf8Length(r.title);
  if (title_len < kTitleMin || title_len > kTitleMax) {
    throw util::InvalidArgument("title must be 5-200 characters");
  }
  const auto description_len = Utf8Length(r.description);
  if (description_len < kDescriptionMin || description_len > kDescriptionMax) {
    throw util::InvalidArgument("description must be 20-5000 characters");
  }
  if (r.pay_type != PAY_TYPE_PER_IMAGE && r.pay_type != PAY_TYPE_FLAT) {
    throw util::InvalidArgument("pay type must be per_image or flat");
  }
  if (r.pay_amount_cents < kMinPayCents) {
    throw util::InvalidArgument("pay amount must be at least $1.00");
  }
  if (r.budget_total_cents < kMinBudgetCents) {
    throw util::InvalidArgument("budget must be at least $10.00");
  }
  if (r.quantity_needed < 1) {
    throw util::InvalidArgument("quantity needed must be at least 1");
  }
  if (r.speed_bonus_cents < 0 || r.quality_bonus_cents < 0) {
    throw util::InvalidArgument("bonuses cannot be negative");
  }
  if (r.speed_bonus_deadline_ms && *r.speed_bonus_deadline_ms <= 0) {
    throw util::InvalidArgument("speed bonus deadline must be a unix millisecond timestamp");
  }
  if (r.initial_status != REQUEST_STATUS_UNSPECIFIED && r.initial_status != REQUEST_STATUS_DRAFT &&
      r.initial_status != REQUEST_STATUS_PUBLISHED) {
    throw util::InvalidArgument("initial status must be draft or published");
  }
}

RequestManager::RequestManager(std::shared_ptr<db::Repository> repository, auth::HasRoleFn has_role)
    : repository_(std::move(repository)), has_role_(std::move(has_role)) {
}

db::model::RequestRecord RequestManager::Create(const NewRequest& request, const std::string& actor) {
  auth::RequireRole(has_role_, actor, ADMIN_ROLE_ADMIN, "create request");
  ValidateNewRequest(request);

  const auto now = util::NowMs();

  db::model::RequestRecord record;
  record.created_by              = actor;
  record.title                   = request.title;
  record.description             = request.description;
  record.pay_type                = request.pay_type;
  record.pay_amount_cents        = request.pay_amount_cents;
  record.speed_bonus_cents       = request.speed_bonus_cents;
  record.speed_bonus_deadline_ms = request.speed_bonus_deadline_ms;
  record.quality_bonus_cents     = request.quality_bonus_cents;
  record.budget_total_cents      = request.budget_total_cents;
  record.quantity_needed         = request.quantity_needed;
  record.created_at_ms           = now;
  record.updated_at_ms           = now;

  if (request.initial_status == REQUEST_STATUS_PUBLISHED) {
    record.status          = REQUEST_STATUS_PUBLISHED;
    record.published_at_ms = now;
    record.reviewed_by     = actor;
    record.reviewed_at_ms  = now;
  } else {
    record.status = REQUEST_STATUS_DRAFT;
  }

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertRequest(*tx, record), "create request");
  tx->Commit();

  BOUNTY_LOG_INFO("request created", {StringField("request_id", record.id), StringField("status", model::ToString(record.status)),
                                      IntField("budget_total_cents", record.budget_total_cents), StringField("actor", actor)});
  return record;
}

db::model::RequestRecord RequestManager::Transition(const std::string& request_id, RequestAction action, const std::string& actor) {
  const auto verb = std::string(model::ToString(action));
  auth::RequireRole(has_role_, actor, ADMIN_ROLE_ADMIN, verb + " request");
  RequireRequestId(request_id);

  const auto target = model::TargetStatus(action);
  if (target == REQUEST_STATUS_UNSPECIFIED) {
    throw util::InvalidArgument("unknown request action");
  }

  const auto                   now = util::NowMs();
  db::model::RequestStatusChange change;
  change.id            = request_id;
  change.from          = model::AllowedSources(action);
  change.to            = target;
  change.updated_at_ms = now;
  if (action == REQUEST_ACTION_PUBLISH) {
    change.published_at_ms = now;
    change.reviewed_by     = actor;
    change.reviewed_at_ms  = now;
  }

  auto tx  = repository_->Begin();
  auto res = repository_->TransitionRequestIf(*tx, change);
  if (res.code == db::ErrorCode::Conflict) {
    // Zero rows: tell a missing request apart from a disallowed source status.
    auto current = repository_->GetRequest(*tx, request_id);
    tx->Rollback();
    if (!current) {
      throw util::NotFound("request not found: " + request_id);
    }
    throw util::InvalidTransition("cannot " + verb + " a request that is " + std::string(model::ToString(current->status)));
  }
  ThrowIfDbError(res, verb + " request");

  auto updated = repository_->GetRequest(*tx, request_id);
  if (!updated) {
    throw std::runtime_error(verb + " request: row vanished after update");
  }
  tx->Commit();

  BOUNTY_LOG_INFO("request transitioned", {StringField("request_id", request_id), StringField("action", verb),
                                           StringField("status", model::ToString(updated->status)), StringField("actor", actor)});
  return *updated;
}

db::model::RequestRecord RequestManager::Publish(const std::string& request_id, const std::string& actor) {
  return Transition(request_id, REQUEST_ACTION_PUBLISH, actor);
}

db::model::RequestRecord RequestManager::Pause(const std::string& request_id, const std::string& actor) {
  return Transition(request_id, REQUEST_ACTION_PAUSE, actor);
}

db::model::RequestRecord RequestManager::Unpause(const std::string& request_id, const std::string& actor) {
  return Transition(request_id, REQUEST_ACTION_UNPAUSE, actor);
}

db::model::RequestRecord RequestManager::Close(const std::string& request_id, const std::string& actor) {
  return Transition(request_id, REQUEST_ACTION_CLOSE, actor);
}

db::model::RequestRecord RequestManager::Cancel(const std::string& request_id, const std::string& actor) {
  return Transition(request_id, REQUEST_ACTION_CANCEL, actor);
}

db::model::RequestRecord RequestManager::Get(const std::string& request_id, const std::string& actor) {
  auth::RequireRole(has_role_, actor, ADMIN_ROLE_REVIEWER, "get request");
  RequireRequestId(request_id);

  auto tx     = repository_->Begin();
  auto record = repository_->GetRequest(*tx, request_id);
  tx->Commit();
  if (!record) throw util::NotFound("request not found: " + request_id);
  return *record;
}

std::vector<db::model::RequestRecord> RequestManager::List(std::optional<RequestStatus> status, const std::string& actor) {
  auth::RequireRole(has_role_, actor, ADMIN_ROLE_REVIEWER, "list requests");

  auto tx      = repository_->Begin();
  auto records = repository_->ListRequests(*tx, status);
  tx->Commit();
  return records;
}

} // namespace bounty::core
