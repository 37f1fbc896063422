#pragma once

#include <string>

#include "internal/util/errors.hpp"

namespace capacity::model {

/*
  Who submitted an entry point call: the privileged root or a signed
  account. Signatures are verified upstream.
*/
struct Origin {
  bool        root = false;
  std::string account;

  static Origin Root() {
    return {true, {}};
  }

  static Origin Signed(std::string account) {
    return {false, std::move(account)};
  }

  bool IsRoot() const {
    return root;
  }
};

inline void EnsureRoot(const Origin& origin, const char* what) {
  if (!origin.IsRoot()) {
    throw util::BadOrigin(std::string(what) + ": root origin required");
  }
}

inline const std::string& EnsureSigned(const Origin& origin, const char* what) {
  if (origin.IsRoot() || origin.account.empty()) {
    throw util::BadOrigin(std::string(what) + ": signed origin required");
  }
  return origin.account;
}

} // namespace capacity::model
