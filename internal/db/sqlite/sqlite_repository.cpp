#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "bounty/ledger/v1.hpp"
#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace bounty::db::sqlite {

using bounty::db::ErrorCode;
using bounty::db::Result;
namespace v1 = bounty::ledger::v1;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(st, &sqlite3_finalize);
}

// Reads have no Result channel; surface driver failures as exceptions.
void ThrowStepError(sqlite3* db, int rc) {
  const int primary = rc & 0xff;
  if (primary == SQLITE_BUSY || primary == SQLITE_LOCKED || primary == SQLITE_IOERR) {
    throw util::StoreUnavailable(sqlite3_errmsg(db));
  }
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
  if (v) {
    BindI64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
  if (v) {
    BindText(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

template <typename Enum>
void BindOptEnum(sqlite3_stmt* st, int idx, const std::optional<Enum>& v) {
  if (v) {
    BindI64(st, idx, static_cast<int64_t>(*v));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

// Statuses travel as "2,3" and are matched with instr() in SQL.
template <typename Enum>
void BindStatusSet(sqlite3_stmt* st, int idx, const std::vector<Enum>& statuses) {
  std::string joined;
  for (auto s : statuses) {
    if (!joined.empty()) joined += ',';
    joined += std::to_string(static_cast<int>(s));
  }
  BindText(st, idx, joined);
}

// SQLite treats a negative LIMIT as unbounded.
void BindLimit(sqlite3_stmt* st, int idx, std::size_t limit) {
  BindI64(st, idx, limit == 0 ? -1 : static_cast<int64_t>(limit));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

std::optional<int64_t> ColOptI64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColI64(st, col);
}

model::RequestRecord ReadRequest(sqlite3_stmt* st) {
  model::RequestRecord r;
  r.id                      = ColText(st, 0);
  r.created_by              = ColText(st, 1);
  r.title                   = ColText(st, 2);
  r.description             = ColText(st, 3);
  r.status                  = static_cast<v1::RequestStatus>(ColI64(st, 4));
  r.pay_type                = static_cast<v1::PayType>(ColI64(st, 5));
  r.pay_amount_cents        = ColI64(st, 6);
  r.speed_bonus_cents       = ColI64(st, 7);
  r.speed_bonus_deadline_ms = ColOptI64(st, 8);
  r.quality_bonus_cents     = ColI64(st, 9);
  r.budget_total_cents      = ColI64(st, 10);
  r.budget_spent_cents      = ColI64(st, 11);
  r.quantity_needed         = ColI64(st, 12);
  r.quantity_fulfilled      = ColI64(st, 13);
  r.published_at_ms         = ColI64(st, 14);
  r.reviewed_by             = ColText(st, 15);
  r.reviewed_at_ms          = ColI64(st, 16);
  r.created_at_ms           = ColI64(st, 17);
  r.updated_at_ms           = ColI64(st, 18);
  r.version                 = static_cast<uint64_t>(ColI64(st, 19));
  return r;
}

model::SubmissionRecord ReadSubmission(sqlite3_stmt* st) {
  model::SubmissionRecord r;
  r.id                  = ColText(st, 0);
  r.request_id          = ColText(st, 1);
  r.contributor_id      = ColText(st, 2);
  r.status              = static_cast<v1::SubmissionStatus>(ColI64(st, 3));
  r.submitted_at_ms     = ColI64(st, 4);
  r.reviewed_by         = ColText(st, 5);
  r.reviewed_at_ms      = ColI64(st, 6);
  r.review_feedback     = ColText(st, 7);
  r.earned_amount_cents = ColI64(st, 8);
  r.bonus_amount_cents  = ColI64(st, 9);
  r.earning_id          = ColText(st, 10);
  r.created_at_ms       = ColI64(st, 11);
  r.updated_at_ms       = ColI64(st, 12);
  return r;
}

model::EarningRecord ReadEarning(sqlite3_stmt* st) {
  model::EarningRecord r;
  r.id                 = ColText(st, 0);
  r.contributor_id     = ColText(st, 1);
  r.submission_id      = ColText(st, 2);
  r.request_id         = ColText(st, 3);
  r.amount_cents       = ColI64(st, 4);
  r.bonus_amount_cents = ColI64(st, 5);
  r.currency           = ColText(st, 6);
  r.status             = static_cast<v1::EarningStatus>(ColI64(st, 7));
  r.description        = ColText(st, 8);
  r.paid_at_ms         = ColI64(st, 9);
  r.created_at_ms      = ColI64(st, 10);
  return r;
}

template <typename Row, typename Reader>
std::vector<Row> CollectRows(sqlite3* db, sqlite3_stmt* st, Reader read) {
  std::vector<Row> out;
  int              rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  if (rc != SQLITE_DONE) ThrowStepError(db, rc);
  return out;
}

template <typename Row, typename Reader>
std::optional<Row> SingleRow(sqlite3* db, sqlite3_stmt* st, Reader read) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowStepError(db, rc);
  return read(st);
}

uint64_t ScalarCount(sqlite3* db, sqlite3_stmt* st) {
  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) ThrowStepError(db, rc);
  return static_cast<uint64_t>(sqlite3_column_int64(st, 0));
}

void FillIdentity(std::string& id, int64_t& created_at_ms) {
  if (id.empty()) id = util::NewId();
  if (created_at_ms == 0) created_at_ms = util::NowMs();
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  const int extended = sqlite3_extended_errcode(db);
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Requests
// ------------------------------------------------------------------

Result SqliteRepository::InsertRequest(Transaction& t, model::RequestRecord& r) {
  auto* db = TX(t).Handle();
  FillIdentity(r.id, r.created_at_ms);
  if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;

  auto st = Prepare(db, sql::INSERT_REQUEST);
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.created_by);
  BindText(st.get(), 3, r.title);
  BindText(st.get(), 4, r.description);
  BindI64(st.get(), 5, r.status);
  BindI64(st.get(), 6, r.pay_type);
  BindI64(st.get(), 7, r.pay_amount_cents);
  BindI64(st.get(), 8, r.speed_bonus_cents);
  BindOptI64(st.get(), 9, r.speed_bonus_deadline_ms);
  BindI64(st.get(), 10, r.quality_bonus_cents);
  BindI64(st.get(), 11, r.budget_total_cents);
  BindI64(st.get(), 12, r.budget_spent_cents);
  BindI64(st.get(), 13, r.quantity_needed);
  BindI64(st.get(), 14, r.quantity_fulfilled);
  BindI64(st.get(), 15, r.published_at_ms);
  BindText(st.get(), 16, r.reviewed_by);
  BindI64(st.get(), 17, r.reviewed_at_ms);
  BindI64(st.get(), 18, r.created_at_ms);
  BindI64(st.get(), 19, r.updated_at_ms);
  BindI64(st.get(), 20, static_cast<int64_t>(r.version));

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::RequestRecord> SqliteRepository::GetRequest(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_REQUEST);
  BindText(st.get(), 1, id);
  return SingleRow<model::RequestRecord>(db, st.get(), ReadRequest);
}

std::vector<model::RequestRecord> SqliteRepository::ListRequests(Transaction& t, std::optional<v1::RequestStatus> status) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_REQUESTS);
  BindOptEnum(st.get(), 1, status);
  return CollectRows<model::RequestRecord>(db, st.get(), ReadRequest);
}

Result SqliteRepository::TransitionRequestIf(Transaction& t, const model::RequestStatusChange& c) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::TRANSITION_REQUEST);
  BindText(st.get(), 1, c.id);
  BindStatusSet(st.get(), 2, c.from);
  BindI64(st.get(), 3, c.to);
  BindOptI64(st.get(), 4, c.published_at_ms);
  BindOptText(st.get(), 5, c.reviewed_by);
  BindOptI64(st.get(), 6, c.reviewed_at_ms);
  BindI64(st.get(), 7, c.updated_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "request " + c.id);
  return res;
}

Result SqliteRepository::SwapRequestCounters(Transaction& t, const model::RequestCounterSwap& c) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SWAP_REQUEST_COUNTERS);
  BindText(st.get(), 1, c.id);
  BindI64(st.get(), 2, static_cast<int64_t>(c.expected_version));
  BindI64(st.get(), 3, c.expected_budget_spent_cents);
  BindI64(st.get(), 4, c.expected_quantity_fulfilled);
  BindI64(st.get(), 5, c.new_budget_spent_cents);
  BindI64(st.get(), 6, c.new_quantity_fulfilled);
  BindOptEnum(st.get(), 7, c.new_status);
  BindI64(st.get(), 8, c.updated_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "request " + c.id + " changed underneath");
  return res;
}

// ------------------------------------------------------------------
// Submissions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSubmission(Transaction& t, model::SubmissionRecord& r) {
  auto* db = TX(t).Handle();
  FillIdentity(r.id, r.created_at_ms);
  if (r.submitted_at_ms == 0) r.submitted_at_ms = r.created_at_ms;
  if (r.updated_at_ms == 0) r.updated_at_ms = r.created_at_ms;

  auto st = Prepare(db, sql::INSERT_SUBMISSION);
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.request_id);
  BindText(st.get(), 3, r.contributor_id);
  BindI64(st.get(), 4, r.status);
  BindI64(st.get(), 5, r.submitted_at_ms);
  BindText(st.get(), 6, r.reviewed_by);
  BindI64(st.get(), 7, r.reviewed_at_ms);
  BindText(st.get(), 8, r.review_feedback);
  BindI64(st.get(), 9, r.earned_amount_cents);
  BindI64(st.get(), 10, r.bonus_amount_cents);
  BindText(st.get(), 11, r.earning_id);
  BindI64(st.get(), 12, r.created_at_ms);
  BindI64(st.get(), 13, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SubmissionRecord> SqliteRepository::GetSubmission(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_SUBMISSION);
  BindText(st.get(), 1, id);
  return SingleRow<model::SubmissionRecord>(db, st.get(), ReadSubmission);
}

std::vector<model::SubmissionRecord> SqliteRepository::ListSubmissions(Transaction& t, const model::SubmissionFilter& f) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_SUBMISSIONS);
  BindOptText(st.get(), 1, f.request_id);
  BindOptEnum(st.get(), 2, f.status);
  BindLimit(st.get(), 3, f.limit);
  return CollectRows<model::SubmissionRecord>(db, st.get(), ReadSubmission);
}

Result SqliteRepository::ReviewSubmissionIf(Transaction& t, const model::SubmissionReview& c) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::REVIEW_SUBMISSION);
  BindText(st.get(), 1, c.id);
  BindStatusSet(st.get(), 2, c.from);
  BindI64(st.get(), 3, c.to);
  BindText(st.get(), 4, c.reviewed_by);
  BindI64(st.get(), 5, c.reviewed_at_ms);
  BindText(st.get(), 6, c.review_feedback);
  BindI64(st.get(), 7, c.earned_amount_cents);
  BindI64(st.get(), 8, c.bonus_amount_cents);
  BindText(st.get(), 9, c.earning_id);
  BindI64(st.get(), 10, c.updated_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "submission " + c.id);
  return res;
}

Result SqliteRepository::InsertSubmissionImage(Transaction& t, model::SubmissionImageRecord& r) {
  auto* db = TX(t).Handle();
  FillIdentity(r.id, r.created_at_ms);

  auto st = Prepare(db, sql::INSERT_SUBMISSION_IMAGE);
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.submission_id);
  BindText(st.get(), 3, r.file_path);
  BindI64(st.get(), 4, r.created_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

uint64_t SqliteRepository::CountSubmissionImages(Transaction& t, const std::string& submission_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::COUNT_SUBMISSION_IMAGES);
  BindText(st.get(), 1, submission_id);
  return ScalarCount(db, st.get());
}

// ------------------------------------------------------------------
// Earnings
// ------------------------------------------------------------------

Result SqliteRepository::InsertEarning(Transaction& t, model::EarningRecord& r) {
  auto* db = TX(t).Handle();
  FillIdentity(r.id, r.created_at_ms);

  auto st = Prepare(db, sql::INSERT_EARNING);
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.contributor_id);
  BindText(st.get(), 3, r.submission_id);
  BindText(st.get(), 4, r.request_id);
  BindI64(st.get(), 5, r.amount_cents);
  BindI64(st.get(), 6, r.bonus_amount_cents);
  BindText(st.get(), 7, r.currency);
  BindI64(st.get(), 8, r.status);
  BindText(st.get(), 9, r.description);
  BindI64(st.get(), 10, r.paid_at_ms);
  BindI64(st.get(), 11, r.created_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "submission " + r.submission_id + " is not awaiting review");
  return res;
}

std::optional<model::EarningRecord> SqliteRepository::GetEarning(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_EARNING);
  BindText(st.get(), 1, id);
  return SingleRow<model::EarningRecord>(db, st.get(), ReadEarning);
}

std::vector<model::EarningRecord> SqliteRepository::ListEarnings(Transaction& t, const model::EarningFilter& f) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_EARNINGS);
  BindOptEnum(st.get(), 1, f.status);
  BindOptText(st.get(), 2, f.request_id);
  BindLimit(st.get(), 3, f.limit);
  BindI64(st.get(), 4, static_cast<int64_t>(f.offset));
  BindI64(st.get(), 5, f.include_provisional ? 1 : 0);
  return CollectRows<model::EarningRecord>(db, st.get(), ReadEarning);
}

uint64_t SqliteRepository::CountEarnings(Transaction& t, std::optional<v1::EarningStatus> status) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::COUNT_EARNINGS);
  BindOptEnum(st.get(), 1, status);
  return ScalarCount(db, st.get());
}

Result SqliteRepository::UpdateEarningStatusIf(Transaction& t, const model::EarningStatusChange& c) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_EARNING_STATUS);
  BindText(st.get(), 1, c.id);
  BindStatusSet(st.get(), 2, c.from);
  BindI64(st.get(), 3, c.to);
  BindOptI64(st.get(), 4, c.paid_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "earning " + c.id);
  return res;
}

Result SqliteRepository::DeleteProvisionalEarning(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::DELETE_PROVISIONAL_EARNING);
  BindText(st.get(), 1, id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (!res) return res;
  if (sqlite3_changes(db) == 0 && GetEarning(t, id)) {
    return Result::Err(ErrorCode::Conflict, "earning " + id + " is no longer provisional");
  }
  return res;
}

std::vector<model::EarningTotal> SqliteRepository::SumEarningsByStatus(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SUM_EARNINGS_BY_STATUS);
  return CollectRows<model::EarningTotal>(db, st.get(), [](sqlite3_stmt* row) {
    model::EarningTotal total;
    total.status       = static_cast<v1::EarningStatus>(ColI64(row, 0));
    total.amount_cents = ColI64(row, 1);
    total.count        = static_cast<uint64_t>(ColI64(row, 2));
    return total;
  });
}

// ------------------------------------------------------------------
// Activity feed
// ------------------------------------------------------------------

Result SqliteRepository::AppendActivity(Transaction& t, model::ActivityRecord& r) {
  auto* db = TX(t).Handle();
  if (r.created_at_ms == 0) r.created_at_ms = util::NowMs();

  auto st = Prepare(db, sql::INSERT_ACTIVITY);
  BindText(st.get(), 1, r.contributor_id);
  BindText(st.get(), 2, r.action);
  BindText(st.get(), 3, r.description);
  if (r.metadata_json.empty()) r.metadata_json = "{}";
  BindText(st.get(), 4, r.metadata_json);
  BindI64(st.get(), 5, r.created_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return res;
}

std::vector<model::ActivityRecord> SqliteRepository::ListActivity(Transaction& t, const std::string& contributor_id, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_ACTIVITY);
  BindText(st.get(), 1, contributor_id);
  BindLimit(st.get(), 2, limit);
  return CollectRows<model::ActivityRecord>(db, st.get(), [](sqlite3_stmt* row) {
    model::ActivityRecord r;
    r.id             = static_cast<uint64_t>(ColI64(row, 0));
    r.contributor_id = ColText(row, 1);
    r.action         = ColText(row, 2);
    r.description    = ColText(row, 3);
    r.metadata_json  = ColText(row, 4);
    r.created_at_ms  = ColI64(row, 5);
    return r;
  });
}

} // namespace bounty::db::sqlite
