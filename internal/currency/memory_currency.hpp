#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/currency/currency.hpp"

namespace capacity::currency {

/*
  In-process ledger. Balances start from configured endowments and are
  lost on restart.
*/
class MemoryCurrency final : public Currency {
 public:
  MemoryCurrency() = default;

  // Mints `amount` into the free balance of `account`.
  void Deposit(const std::string& account, Balance amount);

  void    Reserve(const std::string& account, Balance amount) override;
  Balance Unreserve(const std::string& account, Balance amount) override;
  void    BurnReserved(const std::string& account, Balance amount) override;
  void    Transfer(const std::string& from, const std::string& to, Balance amount) override;

  Balance FreeBalance(const std::string& account) const override;
  Balance ReservedBalance(const std::string& account) const override;

  Balance TotalIssuance() const;

 private:
  struct Account {
    Balance free     = 0;
    Balance reserved = 0;
  };

  mutable std::mutex                       mutex_;
  std::unordered_map<std::string, Account> accounts_;
  Balance                                  total_issuance_ = 0;
};

} // namespace capacity::currency
