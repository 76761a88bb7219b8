#include "pg_repository.hpp"

#include "bounty/ledger/v1.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace bounty::db::postgres {

namespace v1 = bounty::ledger::v1;

namespace {

template <typename Enum>
std::string StatusSet(const std::vector<Enum>& statuses) {
  std::string joined;
  for (auto s : statuses) {
    if (!joined.empty()) joined += ',';
    joined += std::to_string(static_cast<int>(s));
  }
  return joined;
}

template <typename Enum>
std::optional<int> OptEnum(const std::optional<Enum>& v) {
  if (!v) return std::nullopt;
  return static_cast<int>(*v);
}

// NULL limit means ALL in postgres.
std::optional<int64_t> OptLimit(std::size_t limit) {
  if (limit == 0) return std::nullopt;
  return static_cast<int64_t>(limit);
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

model::RequestRecord ReadRequest(const pqxx::row& row) {
  model::RequestRecord r;
  r.id               = row[0].c_str();
  r.created_by       = row[1].c_str();
  r.title            = row[2].c_str();
  r.description      = row[3].c_str();
  r.status           = static_cast<v1::RequestStatus>(row[4].as<int>());
  r.pay_type         = static_cast<v1::PayType>(row[5].as<int>());
  r.pay_amount_cents = row[6].as<int64_t>();
  r.speed_bonus_cents = row[7].as<int64_t>();
  if (!row[8].is_null()) r.speed_bonus_deadline_ms = row[8].as<int64_t>();
  r.quality_bonus_cents = row[9].as<int64_t>();
  r.budget_total_cents  = row[10].as<int64_t>();
  r.budget_spent_cents  = row[11].as<int64_t>();
  r.quantity_needed     = row[12].as<int64_t>();
  r.quantity_fulfilled  = row[13].as<int64_t>();
  r.published_at_ms     = row[14].as<int64_t>();
  r.reviewed_by         = Text(row[15]);
  r.reviewed_at_ms      = row[16].as<int64_t>();
  r.created_at_ms       = row[17].as<int64_t>();
  r.updated_at_ms       = row[18].as<int64_t>();
  r.version             = row[19].as<uint64_t>();
  return r;
}

model::SubmissionRecord ReadSubmission(const pqxx::row& row) {
  model::SubmissionRecord r;
  r.id                  = row[0].c_str();
  r.request_id          = row[1].c_str();
  r.contributor_id      = row[2].c_str();
  r.status              = static_cast<v1::SubmissionStatus>(row[3].as<int>());
  r.submitted_at_ms     = row[4].as<int64_t>();
  r.reviewed_by         = Text(row[5]);
  r.reviewed_at_ms      = row[6].as<int64_t>();
  r.review_feedback     = Text(row[7]);
  r.earned_amount_cents = row[8].as<int64_t>();
  r.bonus_amount_cents  = row[9].as<int64_t>();
  r.earning_id          = Text(row[10]);
  r.created_at_ms       = row[11].as<int64_t>();
  r.updated_at_ms       = row[12].as<int64_t>();
  return r;
}

model::EarningRecord ReadEarning(const pqxx::row& row) {
  model::EarningRecord r;
  r.id                 = row[0].c_str();
  r.contributor_id     = row[1].c_str();
  r.submission_id      = row[2].c_str();
  r.request_id         = row[3].c_str();
  r.amount_cents       = row[4].as<int64_t>();
  r.bonus_amount_cents = row[5].as<int64_t>();
  r.currency           = row[6].c_str();
  r.status             = static_cast<v1::EarningStatus>(row[7].as<int>());
  r.description        = Text(row[8]);
  r.paid_at_ms         = row[9].as<int64_t>();
  r.created_at_ms      = row[10].as<int64_t>();
  return r;
}

template <typename Row, typename Reader>
std::vector<Row> Collect(const pqxx::result& res, Reader read) {
  std::vector<Row> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(read(row));
  return out;
}

void FillIdentity(std::string& id, int64_t& created_at_ms) {
  if (id.empty()) id = util::NewId();
  if (created_at_ms == 0) created_at_ms = util::NowMs();
}

Result Affected(const pqxx::result& res, const std::string& what) {
  if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, what);
  return Result::Ok();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result PgRepository::InsertRequest(Transaction& t, model::RequestRecord& r) {
  FillIdentity(r.id, r.created_at_ms);
  if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;
  try {
    TX(t).Work().exec_prepared("insert_request", r.id, r.created_by, r.title, r.description, static_cast<int>(r.status),
                               static_cast<int>(r.pay_type), r.pay_amount_cents, r.speed_bonus_cents, r.speed_bonus_deadline_ms,
                               r.quality_bonus_cents, r.budget_total_cents, r.budget_spent_cents, r.quantity_needed,
                               r.quantity_fulfilled, r.published_at_ms, r.reviewed_by, r.reviewed_at_ms, r.created_at_ms,
                               r.updated_at_ms, static_cast<int64_t>(r.version));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RequestRecord> PgRepository::GetRequest(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_request", id);
  if (res.empty()) return std::nullopt;
  return ReadRequest(res[0]);
}

std::vector<model::RequestRecord> PgRepository::ListRequests(Transaction& t, std::optional<v1::RequestStatus> status) {
  auto res = TX(t).Work().exec_prepared("list_requests", OptEnum(status));
  return Collect<model::RequestRecord>(res, ReadRequest);
}

Result PgRepository::TransitionRequestIf(Transaction& t, const model::RequestStatusChange& c) {
  try {
    auto res = TX(t).Work().exec_prepared("transition_request", c.id, StatusSet(c.from), static_cast<int>(c.to), c.published_at_ms,
                                          c.reviewed_by, c.reviewed_at_ms, c.updated_at_ms);
    return Affected(res, "request " + c.id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SwapRequestCounters(Transaction& t, const model::RequestCounterSwap& c) {
  try {
    auto res = TX(t).Work().exec_prepared("swap_request_counters", c.id, static_cast<int64_t>(c.expected_version),
                                          c.expected_budget_spent_cents, c.expected_quantity_fulfilled, c.new_budget_spent_cents,
                                          c.new_quantity_fulfilled, OptEnum(c.new_status), c.updated_at_ms);
    return Affected(res, "request " + c.id + " changed underneath");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Submissions
// ------------------------------------------------------------------

Result PgRepository::InsertSubmission(Transaction& t, model::SubmissionRecord& r) {
  FillIdentity(r.id, r.created_at_ms);
  if (r.submitted_at_ms == 0) r.submitted_at_ms = r.created_at_ms;
  if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;
  try {
    TX(t).Work().exec_prepared("insert_submission", r.id, r.request_id, r.contributor_id, static_cast<int>(r.status), r.submitted_at_ms,
                               r.reviewed_by, r.reviewed_at_ms, r.review_feedback, r.earned_amount_cents, r.bonus_amount_cents,
                               r.earning_id, r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SubmissionRecord> PgRepository::GetSubmission(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_submission", id);
  if (res.empty()) return std::nullopt;
  return ReadSubmission(res[0]);
}

std::vector<model::SubmissionRecord> PgRepository::ListSubmissions(Transaction& t, const model::SubmissionFilter& f) {
  auto res = TX(t).Work().exec_prepared("list_submissions", f.request_id, OptEnum(f.status), OptLimit(f.limit));
  return Collect<model::SubmissionRecord>(res, ReadSubmission);
}

Result PgRepository::ReviewSubmissionIf(Transaction& t, const model::SubmissionReview& c) {
  try {
    TX(t).Work().exec_prepared("lock_submission", c.id);
    auto res = TX(t).Work().exec_prepared("review_submission", c.id, StatusSet(c.from), static_cast<int>(c.to), c.reviewed_by,
                                          c.reviewed_at_ms, c.review_feedback, c.earned_amount_cents, c.bonus_amount_cents,
                                          c.earning_id, c.updated_at_ms);
    return Affected(res, "submission " + c.id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertSubmissionImage(Transaction& t, model::SubmissionImageRecord& r) {
  FillIdentity(r.id, r.created_at_ms);
  try {
    TX(t).Work().exec_prepared("insert_submission_image", r.id, r.submission_id, r.file_path, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

uint64_t PgRepository::CountSubmissionImages(Transaction& t, const std::string& submission_id) {
  auto res = TX(t).Work().exec_prepared("count_submission_images", submission_id);
  return res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Earnings
// ------------------------------------------------------------------

Result PgRepository::InsertEarning(Transaction& t, model::EarningRecord& r) {
  FillIdentity(r.id, r.created_at_ms);
  try {
    TX(t).Work().exec_prepared("lock_submission", r.submission_id);
    auto res = TX(t).Work().exec_prepared("insert_earning", r.id, r.contributor_id, r.submission_id, r.request_id, r.amount_cents,
                                          r.bonus_amount_cents, r.currency, static_cast<int>(r.status), r.description, r.paid_at_ms,
                                          r.created_at_ms);
    return Affected(res, "submission " + r.submission_id + " is not awaiting review");
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EarningRecord> PgRepository::GetEarning(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_earning", id);
  if (res.empty()) return std::nullopt;
  return ReadEarning(res[0]);
}

std::vector<model::EarningRecord> PgRepository::ListEarnings(Transaction& t, const model::EarningFilter& f) {
  auto res = TX(t).Work().exec_prepared("list_earnings", OptEnum(f.status), f.request_id, OptLimit(f.limit),
                                        static_cast<int64_t>(f.offset), f.include_provisional);
  return Collect<model::EarningRecord>(res, ReadEarning);
}

uint64_t PgRepository::CountEarnings(Transaction& t, std::optional<v1::EarningStatus> status) {
  auto res = TX(t).Work().exec_prepared("count_earnings", OptEnum(status));
  return res[0][0].as<uint64_t>();
}

Result PgRepository::UpdateEarningStatusIf(Transaction& t, const model::EarningStatusChange& c) {
  try {
    auto res = TX(t).Work().exec_prepared("update_earning_status", c.id, StatusSet(c.from), static_cast<int>(c.to), c.paid_at_ms);
    return Affected(res, "earning " + c.id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteProvisionalEarning(Transaction& t, const std::string& id) {
  try {
    auto& work   = TX(t).Work();
    auto  locked = work.exec_prepared("lock_earning_submission", id);
    auto  res    = work.exec_prepared("delete_provisional_earning", id);
    if (res.affected_rows() == 0 && !locked.empty()) {
      return Result::Err(ErrorCode::Conflict, "earning " + id + " is no longer provisional");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EarningTotal> PgRepository::SumEarningsByStatus(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("sum_earnings_by_status");
  return Collect<model::EarningTotal>(res, [](const pqxx::row& row) {
    model::EarningTotal total;
    total.status       = static_cast<v1::EarningStatus>(row[0].as<int>());
    total.amount_cents = row[1].as<int64_t>();
    total.count        = row[2].as<uint64_t>();
    return total;
  });
}

// ------------------------------------------------------------------
// Activity feed
// ------------------------------------------------------------------

Result PgRepository::AppendActivity(Transaction& t, model::ActivityRecord& r) {
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMs();
  if (r.metadata_json.empty()) r.metadata_json = "{}";
  try {
    auto res = TX(t).Work().exec_prepared("insert_activity", r.contributor_id, r.action, r.description, r.metadata_json, r.created_at_ms);
    r.id     = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ActivityRecord> PgRepository::ListActivity(Transaction& t, const std::string& contributor_id, std::size_t limit) {
  auto res = TX(t).Work().exec_prepared("list_activity", contributor_id, OptLimit(limit));
  return Collect<model::ActivityRecord>(res, [](const pqxx::row& row) {
    model::ActivityRecord r;
    r.id             = row[0].as<uint64_t>();
    r.contributor_id = row[1].c_str();
    r.action         = row[2].c_str();
    r.description    = row[3].c_str();
    r.metadata_json  = row[4].c_str();
    r.created_at_ms  = row[5].as<int64_t>();
    return r;
  });
}

} // namespace bounty::db::postgres
