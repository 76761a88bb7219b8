#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace bounty::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    BOUNTY_LOG_WARN("postgres abort failed", {observability::StringField("error", e.what())});
  }
  // pqxx::work must go before its connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::in_doubt_error& e) {
    finished_ = true;
    throw util::StoreUnavailable(std::string("postgres commit outcome unknown: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    finished_ = true;
    throw util::StoreUnavailable(std::string("postgres connection lost during commit: ") + e.what());
  }
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}
