#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/core/earnings_ledger.hpp"
#include "internal/core/reconciler.hpp"
#include "internal/core/request_manager.hpp"
#include "internal/core/review_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#if BOUNTY_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace bounty::factory {

using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const bounty::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    const int applied = sqlite_db->Migrate();
    BOUNTY_LOG_INFO("sqlite store ready", {StringField("path", database.sqlite().path()), IntField("migrations_applied", applied)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  if (database.has_postgres()) {
#if BOUNTY_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    const int applied = pool->Migrate();
    BOUNTY_LOG_INFO("postgres store ready", {IntField("migrations_applied", applied)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  BOUNTY_LOG_WARN("using in-memory store; nothing survives a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<notify::Notifier> BuildNotifier(const bounty::runtime::config::RuntimeConfig& config,
                                                std::shared_ptr<db::Repository>               repository) {
  if (config.review().notifier() == bounty::runtime::config::NOTIFIER_KIND_LOG_ONLY) {
    return std::make_shared<notify::LoggingNotifier>();
  }
  return std::make_shared<notify::ActivityLogNotifier>(std::move(repository));
}

Application Build(const bounty::runtime::config::RuntimeConfig& config) {
  Application app;
  app.repository = BuildRepository(config);
  app.notifier   = BuildNotifier(config, app.repository);
  app.roles      = auth::RolePolicy::FromConfig(config);

  const auto has_role = app.roles.AsPredicate();

  core::ReviewEngineOptions options;
  options.compensation_max_attempts = config.review().compensation_max_attempts();
  options.compensation_backoff      = std::chrono::milliseconds(config.review().compensation_backoff_ms());

  auto& ctx      = app.context;
  ctx.requests   = std::make_shared<core::RequestManager>(app.repository, has_role);
  ctx.reviews    = std::make_shared<core::ReviewEngine>(app.repository, app.notifier, has_role, options);
  ctx.ledger     = std::make_shared<core::EarningsLedger>(app.repository, has_role);
  ctx.reconciler = std::make_shared<core::Reconciler>(app.repository, ctx.reviews, has_role);

  app.admin_service = std::make_shared<service::BountyAdminService>(ctx);
  return app;
}

} // namespace bounty::factory
