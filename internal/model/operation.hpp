#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace capacity::model {

// Operations in this namespace manage subscriptions themselves and are never
// delegable.
inline constexpr std::string_view kManagementNamespace = "capacity.";

/*
  Downstream operation submitted through the interceptor.

  `name` identifies the call ("module.method"); `payload` is opaque to this
  system. `estimated_cost` is the weight charged when the dispatcher does not
  report an actual cost.
*/
struct Operation {
  std::string name;
  std::string payload;
  uint64_t    estimated_cost = 0;
};

inline bool IsManagementOperation(const Operation& op) {
  return std::string_view(op.name).substr(0, kManagementNamespace.size()) == kManagementNamespace;
}

} // namespace capacity::model
