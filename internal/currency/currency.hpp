#pragma once

#include <cstdint>
#include <string>

namespace capacity::currency {

using Balance = std::uint64_t;

/*
  Currency

  Balance ledger the auction and lock paths move deposits through.
  Every account has a free and a reserved part.

  Failing calls throw util::ResourceExhausted and leave balances untouched.
*/
class Currency {
 public:
  virtual ~Currency() = default;

  // free -> reserved
  virtual void Reserve(const std::string& account, Balance amount) = 0;

  // reserved -> free; releases what it can and returns the part that was
  // not reserved
  virtual Balance Unreserve(const std::string& account, Balance amount) = 0;

  // destroys reserved funds (reduces issuance)
  virtual void BurnReserved(const std::string& account, Balance amount) = 0;

  // free(from) -> free(to)
  virtual void Transfer(const std::string& from, const std::string& to, Balance amount) = 0;

  virtual Balance FreeBalance(const std::string& account) const   = 0;
  virtual Balance ReservedBalance(const std::string& account) const = 0;
};

} // namespace capacity::currency
