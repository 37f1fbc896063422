#pragma once

namespace capacity::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Postgres uses the same statements with $n placeholders, prepared per
  connection in PgPool.
*/

// counters

static constexpr const char* SELECT_COUNTER = "SELECT value FROM capacity_counter WHERE name=?;";

static constexpr const char* UPSERT_COUNTER =
    "INSERT INTO capacity_counter(name,value) VALUES(?,?)"
    " ON CONFLICT(name) DO UPDATE SET value=excluded.value;";

// auctions

static constexpr const char* INSERT_AUCTION =
    "INSERT INTO capacity_auction(id,mode_kind,mode_value,winner,best_price,first_bid_time_ms,subscription_id)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_AUCTION =
    "SELECT id,mode_kind,mode_value,winner,best_price,first_bid_time_ms,subscription_id"
    " FROM capacity_auction WHERE id=?;";

static constexpr const char* LIST_AUCTIONS =
    "SELECT id,mode_kind,mode_value,winner,best_price,first_bid_time_ms,subscription_id"
    " FROM capacity_auction ORDER BY id;";

static constexpr const char* UPDATE_AUCTION =
    "UPDATE capacity_auction SET mode_kind=?,mode_value=?,winner=?,best_price=?,first_bid_time_ms=?,subscription_id=?"
    " WHERE id=?;";

// subscriptions

static constexpr const char* INSERT_SUBSCRIPTION =
    "INSERT INTO capacity_subscription(owner,local_id,free_weight,mode_kind,mode_value,issue_time_ms,last_update_ms,expiration_time_ms)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SUBSCRIPTION =
    "SELECT owner,local_id,free_weight,mode_kind,mode_value,issue_time_ms,last_update_ms,expiration_time_ms"
    " FROM capacity_subscription WHERE owner=? AND local_id=?;";

static constexpr const char* LIST_SUBSCRIPTIONS_BY_OWNER =
    "SELECT owner,local_id,free_weight,mode_kind,mode_value,issue_time_ms,last_update_ms,expiration_time_ms"
    " FROM capacity_subscription WHERE owner=? ORDER BY local_id;";

static constexpr const char* LIST_ALL_SUBSCRIPTIONS =
    "SELECT owner,local_id,free_weight,mode_kind,mode_value,issue_time_ms,last_update_ms,expiration_time_ms"
    " FROM capacity_subscription ORDER BY owner,local_id;";

static constexpr const char* UPDATE_SUBSCRIPTION =
    "UPDATE capacity_subscription SET free_weight=?,mode_kind=?,mode_value=?,issue_time_ms=?,last_update_ms=?,expiration_time_ms=?"
    " WHERE owner=? AND local_id=?;";

static constexpr const char* DELETE_SUBSCRIPTION =
    "DELETE FROM capacity_subscription WHERE owner=? AND local_id=?;";

// locked assets

static constexpr const char* INSERT_LOCKED_ASSETS =
    "INSERT INTO capacity_locked_assets(owner,local_id,amount) VALUES(?,?,?);";

static constexpr const char* SELECT_LOCKED_ASSETS =
    "SELECT owner,local_id,amount FROM capacity_locked_assets WHERE owner=? AND local_id=?;";

static constexpr const char* LIST_LOCKED_ASSETS =
    "SELECT owner,local_id,amount FROM capacity_locked_assets ORDER BY owner,local_id;";

static constexpr const char* DELETE_LOCKED_ASSETS =
    "DELETE FROM capacity_locked_assets WHERE owner=? AND local_id=?;";

} // namespace capacity::db::sql
