#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/auction_record.hpp"
#include "internal/db/model/locked_assets_record.hpp"
#include "internal/db/model/subscription_record.hpp"

namespace capacity::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Id counters advance inside the caller's transaction, so a rolled back
    operation never burns an id
  - A subscription and its locked assets are inserted/deleted in one transaction

  The DB is the source of truth for:
    auctions
    subscription ledgers
    locked deposits
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Auctions
  // ---------------------------------------------------------------------

  // Returns the current global counter value and advances it.
  virtual uint32_t NextAuctionId(Transaction&) = 0;

  virtual Result InsertAuction(Transaction&, const model::AuctionRecord&) = 0;

  virtual std::optional<model::AuctionRecord> GetAuction(Transaction&, uint32_t id) = 0;

  virtual std::vector<model::AuctionRecord> ListAuctions(Transaction&) = 0;

  virtual Result UpdateAuction(Transaction&, const model::AuctionRecord&) = 0;

  // ---------------------------------------------------------------------
  // Subscriptions
  // ---------------------------------------------------------------------

  // Returns the owner's counter value and advances it.
  virtual uint32_t NextSubscriptionId(Transaction&, const std::string& owner) = 0;

  virtual Result InsertSubscription(Transaction&, const model::SubscriptionRecord&) = 0;

  virtual std::optional<model::SubscriptionRecord> GetSubscription(Transaction&, const std::string& owner, uint32_t local_id) = 0;

  virtual std::vector<model::SubscriptionRecord> ListSubscriptions(Transaction&, const std::string& owner) = 0;

  virtual std::vector<model::SubscriptionRecord> ListAllSubscriptions(Transaction&) = 0;

  virtual Result UpdateSubscription(Transaction&, const model::SubscriptionRecord&) = 0;

  virtual Result DeleteSubscription(Transaction&, const std::string& owner, uint32_t local_id) = 0;

  // ---------------------------------------------------------------------
  // Locked assets
  // ---------------------------------------------------------------------

  virtual Result InsertLockedAssets(Transaction&, const model::LockedAssetsRecord&) = 0;

  virtual std::optional<model::LockedAssetsRecord> GetLockedAssets(Transaction&, const std::string& owner, uint32_t local_id) = 0;

  virtual std::vector<model::LockedAssetsRecord> ListLockedAssets(Transaction&) = 0;

  virtual Result DeleteLockedAssets(Transaction&, const std::string& owner, uint32_t local_id) = 0;
};

} // namespace capacity::db
