#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/migrations.hpp"
#include "pg_pool.hpp"

namespace capacity::db::postgres {

// pqxx::work aborts on destruction when neither committed nor aborted.
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);

  pqxx::work& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
};

// Runs schema statements inside one pqxx::work.
class PgMigrationExecutor final : public sql::MigrationExecutor {
public:
  explicit PgMigrationExecutor(pqxx::work& work) : work_(work) {}

  void ExecuteSQL(const std::string& sql) override { work_.exec(sql); }

private:
  pqxx::work& work_;
};

}
