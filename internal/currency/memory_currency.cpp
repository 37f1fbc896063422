#include "memory_currency.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/saturating.hpp"

namespace capacity::currency {

void MemoryCurrency::Deposit(const std::string& account, Balance amount) {
  std::lock_guard lock(mutex_);
  auto&           entry = accounts_[account];

  const auto free  = util::CheckedAdd(entry.free, amount);
  const auto total = util::CheckedAdd(total_issuance_, amount);
  if (!free || !total) {
    throw util::ResourceExhausted("deposit to " + account + " overflows issuance");
  }
  entry.free      = *free;
  total_issuance_ = *total;
}

void MemoryCurrency::Reserve(const std::string& account, Balance amount) {
  std::lock_guard lock(mutex_);
  auto&           entry = accounts_[account];
  if (entry.free < amount) {
    throw util::ResourceExhausted("reserve " + std::to_string(amount) + " from " + account + ": free balance " + std::to_string(entry.free));
  }
  entry.free -= amount;
  entry.reserved += amount;
}

Balance MemoryCurrency::Unreserve(const std::string& account, Balance amount) {
  std::lock_guard lock(mutex_);
  auto            it = accounts_.find(account);
  if (it == accounts_.end()) {
    return amount;
  }

  const Balance released = std::min(amount, it->second.reserved);
  it->second.reserved -= released;
  it->second.free += released;
  return amount - released;
}

void MemoryCurrency::BurnReserved(const std::string& account, Balance amount) {
  std::lock_guard lock(mutex_);
  auto            it = accounts_.find(account);
  if (it == accounts_.end() || it->second.reserved < amount) {
    throw util::ResourceExhausted("burn " + std::to_string(amount) + " from " + account + ": insufficient reserved balance");
  }
  it->second.reserved -= amount;
  total_issuance_ -= amount;
}

void MemoryCurrency::Transfer(const std::string& from, const std::string& to, Balance amount) {
  std::lock_guard lock(mutex_);
  auto&           source = accounts_[from];
  if (source.free < amount) {
    throw util::ResourceExhausted("transfer " + std::to_string(amount) + " from " + from + ": free balance " + std::to_string(source.free));
  }
  if (from == to) {
    return;
  }

  auto&      target = accounts_[to];
  const auto credit = util::CheckedAdd(target.free, amount);
  if (!credit) {
    throw util::ResourceExhausted("transfer to " + to + " overflows balance");
  }
  source.free -= amount;
  target.free = *credit;
}

Balance MemoryCurrency::FreeBalance(const std::string& account) const {
  std::lock_guard lock(mutex_);
  auto            it = accounts_.find(account);
  return it == accounts_.end() ? 0 : it->second.free;
}

Balance MemoryCurrency::ReservedBalance(const std::string& account) const {
  std::lock_guard lock(mutex_);
  auto            it = accounts_.find(account);
  return it == accounts_.end() ? 0 : it->second.reserved;
}

Balance MemoryCurrency::TotalIssuance() const {
  std::lock_guard lock(mutex_);
  return total_issuance_;
}

} // namespace capacity::currency
