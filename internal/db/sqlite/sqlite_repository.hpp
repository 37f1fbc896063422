#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace capacity::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  uint32_t NextAuctionId(Transaction&) override;
  Result InsertAuction(Transaction&, const model::AuctionRecord&) override;
  std::optional<model::AuctionRecord> GetAuction(Transaction&, uint32_t id) override;
  std::vector<model::AuctionRecord> ListAuctions(Transaction&) override;
  Result UpdateAuction(Transaction&, const model::AuctionRecord&) override;

  uint32_t NextSubscriptionId(Transaction&, const std::string& owner) override;
  Result InsertSubscription(Transaction&, const model::SubscriptionRecord&) override;
  std::optional<model::SubscriptionRecord> GetSubscription(Transaction&, const std::string& owner, uint32_t local_id) override;
  std::vector<model::SubscriptionRecord> ListSubscriptions(Transaction&, const std::string& owner) override;
  std::vector<model::SubscriptionRecord> ListAllSubscriptions(Transaction&) override;
  Result UpdateSubscription(Transaction&, const model::SubscriptionRecord&) override;
  Result DeleteSubscription(Transaction&, const std::string& owner, uint32_t local_id) override;

  Result InsertLockedAssets(Transaction&, const model::LockedAssetsRecord&) override;
  std::optional<model::LockedAssetsRecord> GetLockedAssets(Transaction&, const std::string& owner, uint32_t local_id) override;
  std::vector<model::LockedAssetsRecord> ListLockedAssets(Transaction&) override;
  Result DeleteLockedAssets(Transaction&, const std::string& owner, uint32_t local_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  uint32_t NextCounter(Transaction& t, const std::string& name);
};

}
