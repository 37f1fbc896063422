#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace capacity::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

uint32_t MemoryRepository::NextAuctionId(Transaction& t) {
  return TX(t).Mutable().next_auction_id++;
}

Result MemoryRepository::InsertAuction(Transaction& t, const model::AuctionRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.auctions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "auction " + std::to_string(r.id));
  s.auctions[r.id] = r;
  return Result::Ok();
}

std::optional<model::AuctionRecord> MemoryRepository::GetAuction(Transaction& t, uint32_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.auctions.find(id);
  if (it == s.auctions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::AuctionRecord> MemoryRepository::ListAuctions(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::AuctionRecord> records;
  records.reserve(s.auctions.size());
  for (const auto& [_, record] : s.auctions) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateAuction(Transaction& t, const model::AuctionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.auctions.contains(r.id)) return Result::Err(ErrorCode::NotFound, "auction " + std::to_string(r.id));
  s.auctions[r.id] = r;
  return Result::Ok();
}

uint32_t MemoryRepository::NextSubscriptionId(Transaction& t, const std::string& owner) {
  return TX(t).Mutable().next_subscription_id[owner]++;
}

Result MemoryRepository::InsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  auto& s = TX(t).Mutable();
  Key   key{r.owner, r.local_id};
  if (s.subscriptions.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "subscription " + r.owner + "/" + std::to_string(r.local_id));
  s.subscriptions[key] = r;
  return Result::Ok();
}

std::optional<model::SubscriptionRecord> MemoryRepository::GetSubscription(Transaction& t, const std::string& owner, uint32_t local_id) {
  const auto& s  = TX(t).View();
  auto        it = s.subscriptions.find(Key{owner, local_id});
  if (it == s.subscriptions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SubscriptionRecord> MemoryRepository::ListSubscriptions(Transaction& t, const std::string& owner) {
  std::vector<model::SubscriptionRecord> out;
  const auto&                            s = TX(t).View();
  for (auto it = s.subscriptions.lower_bound(Key{owner, 0}); it != s.subscriptions.end() && it->first.first == owner; ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::vector<model::SubscriptionRecord> MemoryRepository::ListAllSubscriptions(Transaction& t) {
  std::vector<model::SubscriptionRecord> out;
  for (const auto& [_, record] : TX(t).View().subscriptions) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::UpdateSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.subscriptions.find(Key{r.owner, r.local_id});
  if (it == s.subscriptions.end()) return Result::Err(ErrorCode::NotFound, "subscription " + r.owner + "/" + std::to_string(r.local_id));
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSubscription(Transaction& t, const std::string& owner, uint32_t local_id) {
  auto& s = TX(t).Mutable();
  if (s.subscriptions.erase(Key{owner, local_id}) == 0) {
    return Result::Err(ErrorCode::NotFound, "subscription " + owner + "/" + std::to_string(local_id));
  }
  return Result::Ok();
}

Result MemoryRepository::InsertLockedAssets(Transaction& t, const model::LockedAssetsRecord& r) {
  auto& s = TX(t).Mutable();
  Key   key{r.owner, r.local_id};
  if (s.locked_assets.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "locked assets " + r.owner + "/" + std::to_string(r.local_id));
  s.locked_assets[key] = r;
  return Result::Ok();
}

std::optional<model::LockedAssetsRecord> MemoryRepository::GetLockedAssets(Transaction& t, const std::string& owner, uint32_t local_id) {
  const auto& s  = TX(t).View();
  auto        it = s.locked_assets.find(Key{owner, local_id});
  if (it == s.locked_assets.end()) return std::nullopt;
  return it->second;
}

std::vector<model::LockedAssetsRecord> MemoryRepository::ListLockedAssets(Transaction& t) {
  std::vector<model::LockedAssetsRecord> out;
  for (const auto& [_, record] : TX(t).View().locked_assets) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteLockedAssets(Transaction& t, const std::string& owner, uint32_t local_id) {
  auto& s = TX(t).Mutable();
  if (s.locked_assets.erase(Key{owner, local_id}) == 0) {
    return Result::Err(ErrorCode::NotFound, "locked assets " + owner + "/" + std::to_string(local_id));
  }
  return Result::Ok();
}

} // namespace capacity::db::memory
