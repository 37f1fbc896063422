#include "migrations.hpp"

#include <stdexcept>

namespace capacity::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (std::size_t i = 0; i < ordered_sql.size(); ++i) {
    try {
      executor.ExecuteSQL(ordered_sql[i]);
    } catch (const std::exception& e) {
      throw std::runtime_error("migration step " + std::to_string(i) + " failed: " + e.what());
    }
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS capacity_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS capacity_counter (name TEXT PRIMARY KEY, value INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS capacity_auction (id INTEGER PRIMARY KEY, mode_kind INTEGER NOT NULL, mode_value INTEGER NOT NULL, winner TEXT, "
      "best_price INTEGER NOT NULL, first_bid_time_ms INTEGER, subscription_id INTEGER);",
      "CREATE TABLE IF NOT EXISTS capacity_subscription (owner TEXT NOT NULL, local_id INTEGER NOT NULL, free_weight INTEGER NOT NULL, mode_kind "
      "INTEGER NOT NULL, mode_value INTEGER NOT NULL, issue_time_ms INTEGER NOT NULL, last_update_ms INTEGER NOT NULL, expiration_time_ms INTEGER, "
      "PRIMARY KEY (owner, local_id));",
      "CREATE TABLE IF NOT EXISTS capacity_locked_assets (owner TEXT NOT NULL, local_id INTEGER NOT NULL, amount INTEGER NOT NULL, PRIMARY KEY "
      "(owner, local_id));",
      "INSERT OR IGNORE INTO capacity_schema_migrations(version, applied_at_ms) VALUES(1, unixepoch() * 1000);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS capacity_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
      "CREATE TABLE IF NOT EXISTS capacity_counter (name TEXT PRIMARY KEY, value BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS capacity_auction (id BIGINT PRIMARY KEY, mode_kind SMALLINT NOT NULL, mode_value BIGINT NOT NULL, winner TEXT, "
      "best_price BIGINT NOT NULL, first_bid_time_ms BIGINT, subscription_id BIGINT);",
      "CREATE TABLE IF NOT EXISTS capacity_subscription (owner TEXT NOT NULL, local_id BIGINT NOT NULL, free_weight BIGINT NOT NULL, mode_kind "
      "SMALLINT NOT NULL, mode_value BIGINT NOT NULL, issue_time_ms BIGINT NOT NULL, last_update_ms BIGINT NOT NULL, expiration_time_ms BIGINT, "
      "PRIMARY KEY (owner, local_id));",
      "CREATE TABLE IF NOT EXISTS capacity_locked_assets (owner TEXT NOT NULL, local_id BIGINT NOT NULL, amount BIGINT NOT NULL, PRIMARY KEY "
      "(owner, local_id));",
      "INSERT INTO capacity_schema_migrations(version) VALUES(1) ON CONFLICT (version) DO NOTHING;"};
  return kSchema;
}

} // namespace capacity::db::sql
