#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "internal/delegation/delegation_filter.hpp"

namespace capacity::delegation {

/*
  ProxyGrantTable

  One grant per (owner, delegate) pair, naming the single subscription the
  delegate may charge. Granting again replaces the previous local_id.
  Management operations are refused regardless of grants.
*/
class ProxyGrantTable final : public DelegationFilter {
 public:
  void Grant(const std::string& owner, const std::string& delegate, uint32_t local_id);

  // Returns false if no grant existed.
  bool Revoke(const std::string& owner, const std::string& delegate);

  std::optional<uint32_t> Lookup(const std::string& owner, const std::string& delegate) const;

  std::size_t Size() const;

  bool MayUse(const std::string& delegate, const std::string& owner, uint32_t local_id, const model::Operation& operation) const override;

 private:
  using Key = std::pair<std::string, std::string>;

  mutable std::mutex       mutex_;
  std::map<Key, uint32_t>  grants_;
};

} // namespace capacity::delegation
