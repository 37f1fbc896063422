#include "pg_pool.hpp"

namespace capacity::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] {
    return !idle_.empty() || live_connections_ < max_connections_;
  });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("next_counter",
               "INSERT INTO capacity_counter(name,value) VALUES($1,1) "
               "ON CONFLICT(name) DO UPDATE SET value=capacity_counter.value+1 "
               "RETURNING value-1");

  conn.prepare("insert_auction",
               "INSERT INTO capacity_auction(id,mode_kind,mode_value,winner,best_price,first_bid_time_ms,subscription_id) "
               "VALUES($1,$2,$3,$4,$5,$6,$7)");
  conn.prepare("get_auction",
               "SELECT id,mode_kind,mode_value,winner,best_price,first_bid_time_ms,subscription_id "
               "FROM capacity_auction WHERE id=$1");
  conn.prepare("list_auctions",
               "SELECT id,mode_kind,mode_value,winner,best_price,first_bid_time_ms,subscription_id "
               "FROM capacity_auction ORDER BY id");
  conn.prepare("update_auction",
               "UPDATE capacity_auction SET mode_kind=$2,mode_value=$3,winner=$4,best_price=$5,first_bid_time_ms=$6,subscription_id=$7 "
               "WHERE id=$1");

  conn.prepare("insert_subscription",
               "INSERT INTO capacity_subscription(owner,local_id,free_weight,mode_kind,mode_value,issue_time_ms,last_update_ms,expiration_time_ms) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8)");
  conn.prepare("get_subscription",
               "SELECT owner,local_id,free_weight,mode_kind,mode_value,issue_time_ms,last_update_ms,expiration_time_ms "
               "FROM capacity_subscription WHERE owner=$1 AND local_id=$2");
  conn.prepare("list_subscriptions",
               "SELECT owner,local_id,free_weight,mode_kind,mode_value,issue_time_ms,last_update_ms,expiration_time_ms "
               "FROM capacity_subscription WHERE owner=$1 ORDER BY local_id");
  conn.prepare("list_all_subscriptions",
               "SELECT owner,local_id,free_weight,mode_kind,mode_value,issue_time_ms,last_update_ms,expiration_time_ms "
               "FROM capacity_subscription ORDER BY owner,local_id");
  conn.prepare("update_subscription",
               "UPDATE capacity_subscription SET free_weight=$3,mode_kind=$4,mode_value=$5,issue_time_ms=$6,last_update_ms=$7,expiration_time_ms=$8 "
               "WHERE owner=$1 AND local_id=$2");
  conn.prepare("delete_subscription", "DELETE FROM capacity_subscription WHERE owner=$1 AND local_id=$2");

  conn.prepare("insert_locked_assets", "INSERT INTO capacity_locked_assets(owner,local_id,amount) VALUES($1,$2,$3)");
  conn.prepare("get_locked_assets", "SELECT owner,local_id,amount FROM capacity_locked_assets WHERE owner=$1 AND local_id=$2");
  conn.prepare("list_locked_assets", "SELECT owner,local_id,amount FROM capacity_locked_assets ORDER BY owner,local_id");
  conn.prepare("delete_locked_assets", "DELETE FROM capacity_locked_assets WHERE owner=$1 AND local_id=$2");
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
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace capacity::db::postgres
