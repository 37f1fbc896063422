#include "proxy_grant_table.hpp"

namespace capacity::delegation {

void ProxyGrantTable::Grant(const std::string& owner, const std::string& delegate, uint32_t local_id) {
  std::lock_guard lock(mutex_);
  grants_[Key{owner, delegate}] = local_id;
}

bool ProxyGrantTable::Revoke(const std::string& owner, const std::string& delegate) {
  std::lock_guard lock(mutex_);
  return grants_.erase(Key{owner, delegate}) > 0;
}

std::optional<uint32_t> ProxyGrantTable::Lookup(const std::string& owner, const std::string& delegate) const {
  std::lock_guard lock(mutex_);
  auto            it = grants_.find(Key{owner, delegate});
  if (it == grants_.end()) return std::nullopt;
  return it->second;
}

std::size_t ProxyGrantTable::Size() const {
  std::lock_guard lock(mutex_);
  return grants_.size();
}

bool ProxyGrantTable::MayUse(const std::string& delegate, const std::string& owner, uint32_t local_id, const model::Operation& operation) const {
  if (model::IsManagementOperation(operation)) {
    return false;
  }

  const auto granted = Lookup(owner, delegate);
  return granted.has_value() && *granted == local_id;
}

} // namespace capacity::delegation
