#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/asset_lock_accountant.hpp"
#include "internal/core/auction_manager.hpp"
#include "internal/core/journal_dispatcher.hpp"
#include "internal/core/quota_accountant.hpp"
#include "internal/core/request_interceptor.hpp"
#include "internal/currency/memory_currency.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/delegation/proxy_grant_table.hpp"
#include "internal/events/event_log.hpp"
#include "internal/events/logging_event_sink.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/auction_server.hpp"
#include "internal/grpc/subscription_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/reservation/reservation_table.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/auction_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/subscription_service.hpp"
#include "internal/util/time.hpp"
#if CAPACITY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if CAPACITY_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_tx.hpp"
#endif

namespace capacity::factory {

using namespace capacity;

namespace {

// Events kept for DrainEvents before the oldest are dropped.
constexpr std::size_t kEventBacklog   = 4096;
constexpr std::size_t kJournalBacklog = 4096;

#if CAPACITY_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  db::postgres::PgMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());
  tx.commit();
}
#endif

core::QuotaAccountant::Options QuotaOptions(const runtime::config::RuntimeConfig& config) {
  core::QuotaAccountant::Options options;
  options.reference_call_cost = config.quota().reference_call_cost();
  options.daily_utps          = config.quota().daily_utps();
  options.max_free_weight     = config.quota().max_free_weight();
  return options;
}

core::AuctionManager::Options AuctionOptions(const runtime::config::RuntimeConfig& config) {
  core::AuctionManager::Options options;
  options.duration_ms = util::ToMillis(config.auction().duration());
  options.minimal_bid = config.auction().minimal_bid();
  return options;
}

core::AssetLockAccountant::Options LockOptions(const runtime::config::RuntimeConfig& config) {
  core::AssetLockAccountant::Options options;
  options.ratio             = {config.lock().asset_to_tps_ratio().numerator(), config.lock().asset_to_tps_ratio().denominator()};
  options.custodial_account = config.lock().custodial_account();
  return options;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if CAPACITY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SqliteSchema());
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if CAPACITY_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri());
    BootstrapPostgresSchema(pool);
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const runtime::config::RuntimeConfig& config, std::shared_ptr<const util::TimeSource> clock) {
  Application app;

  app.clock = clock ? std::move(clock) : std::make_shared<util::SystemTimeSource>();

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  app.currency = std::make_shared<currency::MemoryCurrency>();
  for (const auto& endowment : config.ledger().endowments()) {
    app.currency->Deposit(endowment.account(), endowment.balance());
  }

  app.events = std::make_shared<events::EventLog>(kEventBacklog);
  auto sink  = std::make_shared<events::LoggingEventSink>(app.events);

  app.grants = std::make_shared<delegation::ProxyGrantTable>();
  for (const auto& grant : config.delegations()) {
    app.grants->Grant(grant.owner(), grant.delegate(), grant.local_id());
  }

  app.reservations =
      std::make_shared<reservation::ReservationTable>(app.clock, std::chrono::milliseconds(util::ToMillis(config.interceptor().reservation_ttl())));
  app.dispatcher = std::make_shared<core::JournalDispatcher>(kJournalBacklog);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.quota       = std::make_shared<core::QuotaAccountant>(QuotaOptions(config));
  app.auctions    = std::make_shared<core::AuctionManager>(app.repository, app.currency, sink, app.clock, AuctionOptions(config));
  app.locks       = std::make_shared<core::AssetLockAccountant>(app.repository, app.currency, sink, app.clock, LockOptions(config));
#ifdef ENABLE_OTEL
  // seed the gauge once; lock and unlock adjust it afterwards
  observability::Metrics::Instance().SetLockedTotal(app.locks->LockedTotal());
#endif
  app.interceptor = std::make_shared<core::RequestInterceptor>(app.repository, app.quota, app.grants, app.reservations, sink, app.clock);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.auctions     = app.auctions;
  ctx.locks        = app.locks;
  ctx.interceptor  = app.interceptor;
  ctx.dispatcher   = app.dispatcher;
  ctx.reservations = app.reservations;
  ctx.events       = app.events;
  ctx.repository   = app.repository;

  auto auction_service      = std::make_shared<service::AuctionService>(ctx);
  auto subscription_service = std::make_shared<service::SubscriptionService>(ctx);
  auto admin_service        = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AuctionServer>(auction_service));
  app.grpc_services.push_back(std::make_unique<grpc::SubscriptionServer>(subscription_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  const char* database = "memory";
  if (config.database().has_sqlite()) {
    database = "sqlite";
  } else if (config.database().has_postgres()) {
    database = "postgres";
  }
  CAPACITY_LOG_INFO("capacity manager assembled", {observability::StringField("database", database),
                                                   observability::UintField("endowments", config.ledger().endowments_size()),
                                                   observability::UintField("delegations", config.delegations_size())});
  return app;
}

} // namespace capacity::factory
