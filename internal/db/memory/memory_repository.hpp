#pragma once

#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace capacity::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // ordered so listings come back in key order on every backend
  using Key = std::pair<std::string, uint32_t>;

  struct State {
    std::map<uint32_t, model::AuctionRecord>  auctions;
    std::map<Key, model::SubscriptionRecord>  subscriptions;
    std::map<Key, model::LockedAssetsRecord>  locked_assets;

    uint32_t                                  next_auction_id = 0;
    std::unordered_map<std::string, uint32_t> next_subscription_id;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
