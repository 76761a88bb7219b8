#include "pg_pool.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/util/time.hpp"

namespace bounty::db::postgres {

namespace {

constexpr const char* kRequestColumns =
    "id,created_by,title,description,status,pay_type,pay_amount_cents,speed_bonus_cents,speed_bonus_deadline_ms,"
    "quality_bonus_cents,budget_total_cents,budget_spent_cents,quantity_needed,quantity_fulfilled,"
    "published_at_ms,reviewed_by,reviewed_at_ms,created_at_ms,updated_at_ms,version";

constexpr const char* kSubmissionColumns =
    "id,request_id,contributor_id,status,submitted_at_ms,reviewed_by,reviewed_at_ms,review_feedback,"
    "earned_amount_cents,bonus_amount_cents,earning_id,created_at_ms,updated_at_ms";

constexpr const char* kEarningColumns =
    "id,contributor_id,submission_id,request_id,amount_cents,bonus_amount_cents,currency,status,description,paid_at_ms,created_at_ms";

class PgMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {}

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  int AppliedVersion() override {
    auto res = tx_.exec("SELECT COALESCE(MAX(version),0) FROM schema_migrations;");
    return res[0][0].as<int>();
  }

  void RecordVersion(int version) override {
    tx_.exec_params("INSERT INTO schema_migrations(version,applied_at_ms) VALUES($1,$2);", version, util::NowMs());
  }

 private:
  pqxx::work& tx_;
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception&) {
    std::lock_guard rollback_lock(mutex_);
    --live_connections_;
    cv_.notify_one();
    throw;
  }
}

int PgPool::Migrate() {
  // Schema DDL runs on a fresh connection so prepared statements see the tables.
  pqxx::connection    conn(conninfo_);
  pqxx::work          tx(conn);
  PgMigrationExecutor executor(tx);
  tx.exec("SELECT pg_advisory_xact_lock(7245001);"); // one migrator at a time
  int applied = sql::RunMigrations(executor, sql::Dialect::Postgres);
  tx.commit();
  return applied;
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string requests    = kRequestColumns;
  const std::string submissions = kSubmissionColumns;
  const std::string earnings    = kEarningColumns;

  conn.prepare("insert_request",
               "INSERT INTO bounty_requests(" + requests + ")"
               " VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20)");
  conn.prepare("get_request", "SELECT " + requests + " FROM bounty_requests WHERE id=$1");
  conn.prepare("list_requests",
               "SELECT " + requests + " FROM bounty_requests"
               " WHERE ($1::int IS NULL OR status=$1) ORDER BY created_at_ms DESC, id ASC");
  conn.prepare("transition_request",
               "UPDATE bounty_requests SET status=$3,"
               " published_at_ms=COALESCE($4,published_at_ms), reviewed_by=COALESCE($5,reviewed_by),"
               " reviewed_at_ms=COALESCE($6,reviewed_at_ms), updated_at_ms=$7, version=version+1"
               " WHERE id=$1 AND status = ANY(string_to_array($2, ',')::int[])");
  conn.prepare("swap_request_counters",
               "UPDATE bounty_requests SET budget_spent_cents=$5, quantity_fulfilled=$6,"
               " status=COALESCE($7::int,status), updated_at_ms=$8, version=version+1"
               " WHERE id=$1 AND version=$2 AND budget_spent_cents=$3 AND quantity_fulfilled=$4");

  conn.prepare("insert_submission",
               "INSERT INTO bounty_submissions(" + submissions + ")"
               " VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13)");
  conn.prepare("get_submission", "SELECT " + submissions + " FROM bounty_submissions WHERE id=$1");
  conn.prepare("list_submissions",
               "SELECT " + submissions + " FROM bounty_submissions"
               " WHERE ($1::text IS NULL OR request_id=$1) AND ($2::int IS NULL OR status=$2)"
               " ORDER BY submitted_at_ms ASC, id ASC LIMIT $3");
  // Claim checks read across bounty_submissions and earnings; at READ COMMITTED
  // they must run under the submission row lock.
  conn.prepare("lock_submission", "SELECT id FROM bounty_submissions WHERE id=$1 FOR UPDATE");
  conn.prepare("lock_earning_submission",
               "SELECT s.id FROM bounty_submissions s JOIN earnings e ON e.submission_id=s.id WHERE e.id=$1 FOR UPDATE OF s");
  conn.prepare("review_submission",
               "UPDATE bounty_submissions SET status=$3, reviewed_by=$4, reviewed_at_ms=$5, review_feedback=$6,"
               " earned_amount_cents=$7, bonus_amount_cents=$8, earning_id=$9, updated_at_ms=$10"
               " WHERE id=$1 AND status = ANY(string_to_array($2, ',')::int[])"
               " AND (($9 = '' AND NOT EXISTS (SELECT 1 FROM earnings e WHERE e.submission_id=$1))"
               "   OR ($9 <> '' AND EXISTS (SELECT 1 FROM earnings e WHERE e.id=$9 AND e.submission_id=$1)))");
  conn.prepare("insert_submission_image",
               "INSERT INTO submission_images(id,submission_id,file_path,created_at_ms) VALUES($1,$2,$3,$4)");
  conn.prepare("count_submission_images", "SELECT COUNT(*) FROM submission_images WHERE submission_id=$1");

  // 1,2 = SUBMISSION_STATUS_SUBMITTED, SUBMISSION_STATUS_IN_REVIEW
  conn.prepare("insert_earning",
               "INSERT INTO earnings(" + earnings + ")"
               " SELECT $1::text,$2::text,$3::text,$4::text,$5::bigint,$6::bigint,$7::text,$8::int,$9::text,$10::bigint,$11::bigint"
               " WHERE EXISTS (SELECT 1 FROM bounty_submissions s WHERE s.id=$3::text AND s.status IN (1,2))");
  conn.prepare("get_earning", "SELECT " + earnings + " FROM earnings WHERE id=$1");
  // 3 = SUBMISSION_STATUS_ACCEPTED
  const std::string committed = "EXISTS (SELECT 1 FROM bounty_submissions s WHERE s.earning_id=earnings.id AND s.status=3)";
  conn.prepare("list_earnings",
               "SELECT " + earnings + " FROM earnings"
               " WHERE ($1::int IS NULL OR status=$1) AND ($2::text IS NULL OR request_id=$2)"
               " AND ($5::boolean OR " + committed + ")"
               " ORDER BY created_at_ms DESC, id ASC LIMIT $3 OFFSET $4");
  conn.prepare("count_earnings", "SELECT COUNT(*) FROM earnings WHERE ($1::int IS NULL OR status=$1) AND " + committed);
  conn.prepare("update_earning_status",
               "UPDATE earnings SET status=$3, paid_at_ms=COALESCE($4,paid_at_ms)"
               " WHERE id=$1 AND status = ANY(string_to_array($2, ',')::int[]) AND " + committed);
  // 1 = EARNING_STATUS_PENDING
  conn.prepare("delete_provisional_earning", "DELETE FROM earnings WHERE id=$1 AND status=1 AND NOT " + committed);
  conn.prepare("sum_earnings_by_status",
               "SELECT status, COALESCE(SUM(amount_cents),0)::bigint, COUNT(*) FROM earnings WHERE " + committed +
                   " GROUP BY status ORDER BY status");

  conn.prepare("insert_activity",
               "INSERT INTO activity_log(contributor_id,action,description,metadata_json,created_at_ms)"
               " VALUES($1,$2,$3,$4,$5) RETURNING id");
  conn.prepare("list_activity",
               "SELECT id,contributor_id,action,description,metadata_json,created_at_ms FROM activity_log"
               " WHERE contributor_id=$1 ORDER BY id DESC LIMIT $2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    // A connection that died mid-transaction is not worth keeping.
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace bounty::db::postgres
