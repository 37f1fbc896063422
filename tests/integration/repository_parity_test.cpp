#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"

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

namespace {

using capacity::db::ErrorCode;
using capacity::db::Repository;
using capacity::db::memory::MemoryRepository;
using capacity::db::model::AuctionRecord;
using capacity::db::model::LockedAssetsRecord;
using capacity::db::model::SubscriptionRecord;
using capacity::model::SubscriptionMode;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

SubscriptionRecord MakeSubscription(const std::string& owner, uint32_t local_id, SubscriptionMode mode) {
  SubscriptionRecord sub;
  sub.owner          = owner;
  sub.local_id       = local_id;
  sub.mode           = mode;
  sub.issue_time_ms  = 1'000;
  sub.last_update_ms = 1'000;
  if (mode.IsDaily()) {
    sub.expiration_time_ms = 1'000 + mode.value * 86'400'000ULL;
  }
  return sub;
}

void VerifyAuctionLifecycle(Repository& repo) {
  uint32_t id = 0;
  {
    auto tx = repo.Begin();
    id      = repo.NextAuctionId(*tx);
    assert(repo.NextAuctionId(*tx) == id + 1);

    AuctionRecord auction;
    auction.id   = id;
    auction.mode = SubscriptionMode::Daily(30);
    assert(repo.InsertAuction(*tx, auction));
    assert(!tx->IsCommitted());
    tx->Commit();
    assert(tx->IsCommitted());
  }
  {
    auto tx      = repo.Begin();
    auto auction = repo.GetAuction(*tx, id);
    assert(auction.has_value());
    assert(auction->mode == SubscriptionMode::Daily(30));
    assert(!auction->winner.has_value());
    assert(!auction->first_bid_time_ms.has_value());
    assert(!auction->subscription_id.has_value());

    auction->winner            = "alice";
    auction->best_price        = 18'000'000'000'000'000'000ULL;
    auction->first_bid_time_ms = 1'700'000'000'000ULL;
    assert(repo.UpdateAuction(*tx, *auction));

    auction->subscription_id = 0;
    assert(repo.UpdateAuction(*tx, *auction));
    tx->Commit();
  }
  {
    auto tx      = repo.Begin();
    auto auction = repo.GetAuction(*tx, id);
    assert(auction.has_value());
    assert(auction->winner == "alice");
    assert(auction->best_price == 18'000'000'000'000'000'000ULL);
    assert(auction->first_bid_time_ms == 1'700'000'000'000ULL);
    assert(auction->subscription_id == 0u);

    bool listed = false;
    for (const auto& row : repo.ListAuctions(*tx)) {
      listed = listed || row.id == id;
    }
    assert(listed);

    AuctionRecord missing;
    missing.id = id + 1'000'000;
    assert(repo.UpdateAuction(*tx, missing).code == ErrorCode::NotFound);
    assert(!repo.GetAuction(*tx, missing.id).has_value());
    tx->Rollback();
  }
}

void VerifySubscriptionLedger(Repository& repo, const std::string& owner) {
  {
    auto tx = repo.Begin();
    assert(repo.NextSubscriptionId(*tx, owner) == 0);
    assert(repo.NextSubscriptionId(*tx, owner) == 1);
    // counters are per owner
    assert(repo.NextSubscriptionId(*tx, owner + "-other") == 0);

    assert(repo.InsertSubscription(*tx, MakeSubscription(owner, 0, SubscriptionMode::Daily(2))));
    assert(repo.InsertSubscription(*tx, MakeSubscription(owner, 1, SubscriptionMode::Lifetime(4'000'000'000U))));
    assert(repo.InsertLockedAssets(*tx, LockedAssetsRecord{owner, 1, 40'000'000}));
    tx->Commit();
  }
  {
    auto tx    = repo.Begin();
    auto daily = repo.GetSubscription(*tx, owner, 0);
    assert(daily.has_value());
    assert(daily->mode == SubscriptionMode::Daily(2));
    assert(daily->expiration_time_ms == 1'000 + 2 * 86'400'000ULL);

    auto lifetime = repo.GetSubscription(*tx, owner, 1);
    assert(lifetime.has_value());
    assert(lifetime->mode == SubscriptionMode::Lifetime(4'000'000'000U));
    assert(!lifetime->expiration_time_ms.has_value());

    auto locked = repo.GetLockedAssets(*tx, owner, 1);
    assert(locked.has_value());
    assert(locked->amount == 40'000'000);
    assert(!repo.GetLockedAssets(*tx, owner, 0).has_value());

    const auto listed = repo.ListSubscriptions(*tx, owner);
    assert(listed.size() == 2);
    assert(listed[0].local_id == 0);
    assert(listed[1].local_id == 1);

    lifetime->free_weight    = 9'000'000'000'000'000'000ULL;
    lifetime->last_update_ms = 5'000;
    assert(repo.UpdateSubscription(*tx, *lifetime));
    tx->Commit();
  }
  {
    auto tx       = repo.Begin();
    auto lifetime = repo.GetSubscription(*tx, owner, 1);
    assert(lifetime->free_weight == 9'000'000'000'000'000'000ULL);
    assert(lifetime->last_update_ms == 5'000);

    assert(repo.DeleteLockedAssets(*tx, owner, 1));
    assert(repo.DeleteSubscription(*tx, owner, 1));
    assert(repo.DeleteSubscription(*tx, owner, 1).code == ErrorCode::NotFound);
    assert(repo.DeleteLockedAssets(*tx, owner, 1).code == ErrorCode::NotFound);
    assert(repo.UpdateSubscription(*tx, MakeSubscription(owner, 7, SubscriptionMode::Daily(1))).code == ErrorCode::NotFound);
    tx->Commit();
  }
  {
    // ids are never reused after a delete
    auto tx = repo.Begin();
    assert(repo.NextSubscriptionId(*tx, owner) == 2);
    assert(repo.ListSubscriptions(*tx, owner).size() == 1);
    tx->Rollback();
  }
}

void VerifyDuplicatesAreRejected(Repository& repo, const std::string& owner) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertSubscription(*tx, MakeSubscription(owner, 0, SubscriptionMode::Daily(1))));
    assert(repo.InsertLockedAssets(*tx, LockedAssetsRecord{owner, 0, 5}));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertSubscription(*tx, MakeSubscription(owner, 0, SubscriptionMode::Daily(9))).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertLockedAssets(*tx, LockedAssetsRecord{owner, 0, 6}).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
  {
    auto tx  = repo.Begin();
    auto sub = repo.GetSubscription(*tx, owner, 0);
    assert(sub->mode == SubscriptionMode::Daily(1));
    assert(repo.GetLockedAssets(*tx, owner, 0)->amount == 5);
    tx->Rollback();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& owner) {
  uint32_t auction_id = 0;
  {
    auto tx    = repo.Begin();
    auction_id = repo.NextAuctionId(*tx);
    assert(repo.NextSubscriptionId(*tx, owner) == 0);
    assert(repo.InsertSubscription(*tx, MakeSubscription(owner, 0, SubscriptionMode::Daily(1))));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(!repo.GetSubscription(*tx, owner, 0).has_value());
    // a rolled back operation never burns an id
    assert(repo.NextSubscriptionId(*tx, owner) == 0);
    assert(repo.NextAuctionId(*tx) == auction_id);
    tx->Rollback();
  }
  {
    // destruction without commit rolls back too
    auto tx = repo.Begin();
    assert(repo.InsertSubscription(*tx, MakeSubscription(owner, 3, SubscriptionMode::Daily(1))));
  }
  {
    auto tx = repo.Begin();
    assert(!repo.GetSubscription(*tx, owner, 3).has_value());
    tx->Rollback();
  }
}

void VerifyConcurrentTransactions(Repository& repo, const std::string& owner, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertSubscription(*tx, MakeSubscription(owner, 0, SubscriptionMode::Lifetime(10))));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  auto r1  = repo.GetSubscription(*tx1, owner, 0);
  auto r2  = repo.GetSubscription(*tx2, owner, 0);
  assert(r1.has_value() && r2.has_value());

  r1->free_weight = 10;
  assert(repo.UpdateSubscription(*tx1, *r1));
  tx1->Commit();

  // the second writer either lands after the first or is refused
  r2->free_weight = 20;
  bool second_committed = true;
  try {
    assert(repo.UpdateSubscription(*tx2, *r2));
    tx2->Commit();
  } catch (const std::exception&) {
    second_committed = false;
    tx2->Rollback();
  }

  auto verify = repo.Begin();
  auto final  = repo.GetSubscription(*verify, owner, 0);
  assert(final.has_value());
  assert(final->free_weight == (second_committed ? 20u : 10u));
  verify->Rollback();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& owner) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->NextSubscriptionId(*tx, owner) == 0);
    auto sub        = MakeSubscription(owner, 0, SubscriptionMode::Lifetime(50'000));
    sub.free_weight = 3'547;
    assert(repo->InsertSubscription(*tx, sub));
    assert(repo->InsertLockedAssets(*tx, LockedAssetsRecord{owner, 0, 500}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->Begin();
  auto sub = repo->GetSubscription(*tx, owner, 0);
  assert(sub.has_value());
  assert(sub->free_weight == 3'547);
  assert(repo->GetLockedAssets(*tx, owner, 0)->amount == 500);
  assert(repo->NextSubscriptionId(*tx, owner) == 1);
  tx->Rollback();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if CAPACITY_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path = std::filesystem::temp_directory_path() / ("capacity_repository_parity_" + std::to_string(NowMs()) + ".db");

  auto make_repo = [db_path]() {
    auto db = std::make_shared<capacity::db::sqlite::SqliteDB>(db_path.string());
    capacity::db::sql::RunMigrations(*db, capacity::db::sql::SqliteSchema());
    return std::make_shared<capacity::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path.string() + "-wal");
        std::filesystem::remove(db_path.string() + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if CAPACITY_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("CAPACITY_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("CAPACITY_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<capacity::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);

      capacity::db::postgres::PgMigrationExecutor executor(tx);
      capacity::db::sql::RunMigrations(executor, capacity::db::sql::PostgresSchema());
      tx.commit();
    }
    return std::make_shared<capacity::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // owners are unique per run so persistent backends can be reused
  const auto run = backend.name + "-" + std::to_string(NowMs());

  VerifyAuctionLifecycle(*repo);
  VerifySubscriptionLedger(*repo, run + "-ledger");
  VerifyDuplicatesAreRejected(*repo, run + "-duplicate");
  VerifyRollbackBehavior(*repo, run + "-rollback");
  VerifyConcurrentTransactions(*repo, run + "-concurrency", backend.supports_parallel_transactions);

  VerifyRestartDurability(backend, run + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if CAPACITY_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if CAPACITY_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "capacity_manager_integration_repository_parity: pass\n";
  return 0;
}
