#include "pg_repository.hpp"

namespace capacity::db::postgres {

namespace {

// BIGINT columns carry u64 values bit-for-bit
int64_t ToDb(uint64_t v) {
  return static_cast<int64_t>(v);
}

template <typename T>
std::optional<int64_t> ToDb(const std::optional<T>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

uint64_t U64(const pqxx::field& f) {
  return static_cast<uint64_t>(f.as<int64_t>());
}

uint32_t U32(const pqxx::field& f) {
  return static_cast<uint32_t>(f.as<int64_t>());
}

capacity::model::SubscriptionMode Mode(const pqxx::field& kind, const pqxx::field& value) {
  capacity::model::SubscriptionMode mode;
  mode.kind  = static_cast<capacity::model::SubscriptionKind>(kind.as<int>());
  mode.value = U32(value);
  return mode;
}

model::AuctionRecord ReadAuction(const pqxx::row& row) {
  model::AuctionRecord r;
  r.id         = U32(row[0]);
  r.mode       = Mode(row[1], row[2]);
  if (!row[3].is_null()) r.winner = row[3].c_str();
  r.best_price = U64(row[4]);
  if (!row[5].is_null()) r.first_bid_time_ms = U64(row[5]);
  if (!row[6].is_null()) r.subscription_id = U32(row[6]);
  return r;
}

model::SubscriptionRecord ReadSubscription(const pqxx::row& row) {
  model::SubscriptionRecord r;
  r.owner          = row[0].c_str();
  r.local_id       = U32(row[1]);
  r.free_weight    = U64(row[2]);
  r.mode           = Mode(row[3], row[4]);
  r.issue_time_ms  = U64(row[5]);
  r.last_update_ms = U64(row[6]);
  if (!row[7].is_null()) r.expiration_time_ms = U64(row[7]);
  return r;
}

model::LockedAssetsRecord ReadLockedAssets(const pqxx::row& row) {
  model::LockedAssetsRecord r;
  r.owner    = row[0].c_str();
  r.local_id = U32(row[1]);
  r.amount   = U64(row[2]);
  return r;
}

Result NotFoundUnlessAffected(const pqxx::result& res, const std::string& what) {
  if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, what);
  return Result::Ok();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

uint32_t PgRepository::NextAuctionId(Transaction& t) {
  auto res = TX(t).Work().exec_prepared1("next_counter", std::string("auction"));
  return U32(res[0]);
}

uint32_t PgRepository::NextSubscriptionId(Transaction& t, const std::string& owner) {
  auto res = TX(t).Work().exec_prepared1("next_counter", "subscription/" + owner);
  return U32(res[0]);
}

Result PgRepository::InsertAuction(Transaction& t, const model::AuctionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_auction", ToDb(r.id), static_cast<int>(r.mode.kind), ToDb(r.mode.value), r.winner, ToDb(r.best_price),
                               ToDb(r.first_bid_time_ms), ToDb(r.subscription_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AuctionRecord> PgRepository::GetAuction(Transaction& t, uint32_t id) {
  auto res = TX(t).Work().exec_prepared("get_auction", ToDb(id));
  if (res.empty()) return std::nullopt;
  return ReadAuction(res[0]);
}

std::vector<model::AuctionRecord> PgRepository::ListAuctions(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_auctions");

  std::vector<model::AuctionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadAuction(row));
  }
  return out;
}

Result PgRepository::UpdateAuction(Transaction& t, const model::AuctionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_auction", ToDb(r.id), static_cast<int>(r.mode.kind), ToDb(r.mode.value), r.winner,
                                          ToDb(r.best_price), ToDb(r.first_bid_time_ms), ToDb(r.subscription_id));
    return NotFoundUnlessAffected(res, "auction " + std::to_string(r.id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_subscription", r.owner, ToDb(r.local_id), ToDb(r.free_weight), static_cast<int>(r.mode.kind),
                               ToDb(r.mode.value), ToDb(r.issue_time_ms), ToDb(r.last_update_ms), ToDb(r.expiration_time_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SubscriptionRecord> PgRepository::GetSubscription(Transaction& t, const std::string& owner, uint32_t local_id) {
  auto res = TX(t).Work().exec_prepared("get_subscription", owner, ToDb(local_id));
  if (res.empty()) return std::nullopt;
  return ReadSubscription(res[0]);
}

std::vector<model::SubscriptionRecord> PgRepository::ListSubscriptions(Transaction& t, const std::string& owner) {
  auto res = TX(t).Work().exec_prepared("list_subscriptions", owner);

  std::vector<model::SubscriptionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSubscription(row));
  }
  return out;
}

std::vector<model::SubscriptionRecord> PgRepository::ListAllSubscriptions(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_all_subscriptions");

  std::vector<model::SubscriptionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSubscription(row));
  }
  return out;
}

Result PgRepository::UpdateSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_subscription", r.owner, ToDb(r.local_id), ToDb(r.free_weight), static_cast<int>(r.mode.kind),
                                          ToDb(r.mode.value), ToDb(r.issue_time_ms), ToDb(r.last_update_ms), ToDb(r.expiration_time_ms));
    return NotFoundUnlessAffected(res, "subscription " + r.owner + "/" + std::to_string(r.local_id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSubscription(Transaction& t, const std::string& owner, uint32_t local_id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_subscription", owner, ToDb(local_id));
    return NotFoundUnlessAffected(res, "subscription " + owner + "/" + std::to_string(local_id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertLockedAssets(Transaction& t, const model::LockedAssetsRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_locked_assets", r.owner, ToDb(r.local_id), ToDb(r.amount));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LockedAssetsRecord> PgRepository::GetLockedAssets(Transaction& t, const std::string& owner, uint32_t local_id) {
  auto res = TX(t).Work().exec_prepared("get_locked_assets", owner, ToDb(local_id));
  if (res.empty()) return std::nullopt;
  return ReadLockedAssets(res[0]);
}

std::vector<model::LockedAssetsRecord> PgRepository::ListLockedAssets(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_locked_assets");

  std::vector<model::LockedAssetsRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadLockedAssets(row));
  }
  return out;
}

Result PgRepository::DeleteLockedAssets(Transaction& t, const std::string& owner, uint32_t local_id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_locked_assets", owner, ToDb(local_id));
    return NotFoundUnlessAffected(res, "locked assets " + owner + "/" + std::to_string(local_id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace capacity::db::postgres
