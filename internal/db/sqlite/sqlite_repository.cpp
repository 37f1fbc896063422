#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace capacity::db::sqlite {

using capacity::db::ErrorCode;
using capacity::db::Result;

namespace {

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StmtPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return StmtPtr(st, &sqlite3_finalize);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

// u64 values round-trip through the signed column bit-for-bit
void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

template <typename T>
void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
  if (v) {
    BindU64(st, idx, static_cast<uint64_t>(*v));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

uint32_t ColU32(sqlite3_stmt* st, int col) {
  return static_cast<uint32_t>(sqlite3_column_int64(st, col));
}

capacity::model::SubscriptionMode ColMode(sqlite3_stmt* st, int kind_col, int value_col) {
  capacity::model::SubscriptionMode mode;
  mode.kind  = static_cast<capacity::model::SubscriptionKind>(sqlite3_column_int(st, kind_col));
  mode.value = ColU32(st, value_col);
  return mode;
}

model::AuctionRecord ReadAuction(sqlite3_stmt* st) {
  model::AuctionRecord r;
  r.id         = ColU32(st, 0);
  r.mode       = ColMode(st, 1, 2);
  if (!IsNull(st, 3)) r.winner = ColText(st, 3);
  r.best_price = ColU64(st, 4);
  if (!IsNull(st, 5)) r.first_bid_time_ms = ColU64(st, 5);
  if (!IsNull(st, 6)) r.subscription_id = ColU32(st, 6);
  return r;
}

model::SubscriptionRecord ReadSubscription(sqlite3_stmt* st) {
  model::SubscriptionRecord r;
  r.owner          = ColText(st, 0);
  r.local_id       = ColU32(st, 1);
  r.free_weight    = ColU64(st, 2);
  r.mode           = ColMode(st, 3, 4);
  r.issue_time_ms  = ColU64(st, 5);
  r.last_update_ms = ColU64(st, 6);
  if (!IsNull(st, 7)) r.expiration_time_ms = ColU64(st, 7);
  return r;
}

model::LockedAssetsRecord ReadLockedAssets(sqlite3_stmt* st) {
  model::LockedAssetsRecord r;
  r.owner    = ColText(st, 0);
  r.local_id = ColU32(st, 1);
  r.amount   = ColU64(st, 2);
  return r;
}

void ThrowIfStepFailed(sqlite3* db, int rc) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
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

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

uint32_t SqliteRepository::NextCounter(Transaction& t, const std::string& name) {
  auto* db = TX(t).Handle();

  uint32_t current = 0;
  {
    auto st = Prepare(db, sql::SELECT_COUNTER);
    BindText(st.get(), 1, name);
    int rc = sqlite3_step(st.get());
    ThrowIfStepFailed(db, rc);
    if (rc == SQLITE_ROW) current = ColU32(st.get(), 0);
  }

  auto st = Prepare(db, sql::UPSERT_COUNTER);
  BindText(st.get(), 1, name);
  BindU64(st.get(), 2, static_cast<uint64_t>(current) + 1);
  ThrowIfStepFailed(db, sqlite3_step(st.get()));
  return current;
}

uint32_t SqliteRepository::NextAuctionId(Transaction& t) {
  return NextCounter(t, "auction");
}

uint32_t SqliteRepository::NextSubscriptionId(Transaction& t, const std::string& owner) {
  return NextCounter(t, "subscription/" + owner);
}

// ------------------------------------------------------------------
// Auctions
// ------------------------------------------------------------------

Result SqliteRepository::InsertAuction(Transaction& t, const model::AuctionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_AUCTION);

  BindU64(st.get(), 1, r.id);
  sqlite3_bind_int(st.get(), 2, static_cast<int>(r.mode.kind));
  BindU64(st.get(), 3, r.mode.value);
  BindOptText(st.get(), 4, r.winner);
  BindU64(st.get(), 5, r.best_price);
  BindOptU64(st.get(), 6, r.first_bid_time_ms);
  BindOptU64(st.get(), 7, r.subscription_id);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AuctionRecord> SqliteRepository::GetAuction(Transaction& t, uint32_t id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_AUCTION);
  BindU64(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadAuction(st.get());
}

std::vector<model::AuctionRecord> SqliteRepository::ListAuctions(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_AUCTIONS);

  std::vector<model::AuctionRecord> out;
  int                               rc = 0;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadAuction(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

Result SqliteRepository::UpdateAuction(Transaction& t, const model::AuctionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_AUCTION);

  sqlite3_bind_int(st.get(), 1, static_cast<int>(r.mode.kind));
  BindU64(st.get(), 2, r.mode.value);
  BindOptText(st.get(), 3, r.winner);
  BindU64(st.get(), 4, r.best_price);
  BindOptU64(st.get(), 5, r.first_bid_time_ms);
  BindOptU64(st.get(), 6, r.subscription_id);
  BindU64(st.get(), 7, r.id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "auction " + std::to_string(r.id));
  }
  return res;
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_SUBSCRIPTION);

  BindText(st.get(), 1, r.owner);
  BindU64(st.get(), 2, r.local_id);
  BindU64(st.get(), 3, r.free_weight);
  sqlite3_bind_int(st.get(), 4, static_cast<int>(r.mode.kind));
  BindU64(st.get(), 5, r.mode.value);
  BindU64(st.get(), 6, r.issue_time_ms);
  BindU64(st.get(), 7, r.last_update_ms);
  BindOptU64(st.get(), 8, r.expiration_time_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SubscriptionRecord> SqliteRepository::GetSubscription(Transaction& t, const std::string& owner, uint32_t local_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_SUBSCRIPTION);
  BindText(st.get(), 1, owner);
  BindU64(st.get(), 2, local_id);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadSubscription(st.get());
}

std::vector<model::SubscriptionRecord> SqliteRepository::ListSubscriptions(Transaction& t, const std::string& owner) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_SUBSCRIPTIONS_BY_OWNER);
  BindText(st.get(), 1, owner);

  std::vector<model::SubscriptionRecord> out;
  int                                    rc = 0;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadSubscription(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

std::vector<model::SubscriptionRecord> SqliteRepository::ListAllSubscriptions(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_ALL_SUBSCRIPTIONS);

  std::vector<model::SubscriptionRecord> out;
  int                                    rc = 0;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadSubscription(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

Result SqliteRepository::UpdateSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_SUBSCRIPTION);

  BindU64(st.get(), 1, r.free_weight);
  sqlite3_bind_int(st.get(), 2, static_cast<int>(r.mode.kind));
  BindU64(st.get(), 3, r.mode.value);
  BindU64(st.get(), 4, r.issue_time_ms);
  BindU64(st.get(), 5, r.last_update_ms);
  BindOptU64(st.get(), 6, r.expiration_time_ms);
  BindText(st.get(), 7, r.owner);
  BindU64(st.get(), 8, r.local_id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "subscription " + r.owner + "/" + std::to_string(r.local_id));
  }
  return res;
}

Result SqliteRepository::DeleteSubscription(Transaction& t, const std::string& owner, uint32_t local_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::DELETE_SUBSCRIPTION);
  BindText(st.get(), 1, owner);
  BindU64(st.get(), 2, local_id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "subscription " + owner + "/" + std::to_string(local_id));
  }
  return res;
}

// ------------------------------------------------------------------
// Locked assets
// ------------------------------------------------------------------

Result SqliteRepository::InsertLockedAssets(Transaction& t, const model::LockedAssetsRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_LOCKED_ASSETS);
  BindText(st.get(), 1, r.owner);
  BindU64(st.get(), 2, r.local_id);
  BindU64(st.get(), 3, r.amount);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::LockedAssetsRecord> SqliteRepository::GetLockedAssets(Transaction& t, const std::string& owner, uint32_t local_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_LOCKED_ASSETS);
  BindText(st.get(), 1, owner);
  BindU64(st.get(), 2, local_id);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ReadLockedAssets(st.get());
}

std::vector<model::LockedAssetsRecord> SqliteRepository::ListLockedAssets(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_LOCKED_ASSETS);

  std::vector<model::LockedAssetsRecord> out;
  int                                    rc = 0;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadLockedAssets(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

Result SqliteRepository::DeleteLockedAssets(Transaction& t, const std::string& owner, uint32_t local_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::DELETE_LOCKED_ASSETS);
  BindText(st.get(), 1, owner);
  BindU64(st.get(), 2, local_id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "locked assets " + owner + "/" + std::to_string(local_id));
  }
  return res;
}

} // namespace capacity::db::sqlite
