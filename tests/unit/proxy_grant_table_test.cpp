#include "internal/delegation/proxy_grant_table.hpp"

#include <cassert>
#include <iostream>

namespace {

using capacity::delegation::ProxyGrantTable;
using capacity::model::Operation;

Operation Op(const std::string& name) {
  Operation op;
  op.name = name;
  return op;
}

void TestGrantAllowsExactlyOneSubscription() {
  ProxyGrantTable grants;
  grants.Grant("alice", "drone", 2);

  assert(grants.MayUse("drone", "alice", 2, Op("robot.move")));
  assert(!grants.MayUse("drone", "alice", 1, Op("robot.move")));
  assert(!grants.MayUse("drone", "bob", 2, Op("robot.move")));
  assert(!grants.MayUse("rover", "alice", 2, Op("robot.move")));
}

void TestManagementOperationsAreNeverDelegable() {
  ProxyGrantTable grants;
  grants.Grant("alice", "drone", 0);

  assert(!grants.MayUse("drone", "alice", 0, Op("capacity.bid")));
  assert(!grants.MayUse("drone", "alice", 0, Op("capacity.stop_lifetime")));
  // prefix match only, not substring
  assert(grants.MayUse("drone", "alice", 0, Op("robot.capacity.check")));
}

void TestRegrantReplacesAndRevokeRemoves() {
  ProxyGrantTable grants;
  grants.Grant("alice", "drone", 0);
  grants.Grant("alice", "drone", 3);
  grants.Grant("bob", "drone", 0);

  assert(grants.Size() == 2);
  assert(grants.Lookup("alice", "drone") == 3u);
  assert(!grants.MayUse("drone", "alice", 0, Op("robot.move")));

  assert(grants.Revoke("alice", "drone"));
  assert(!grants.Revoke("alice", "drone"));
  assert(!grants.Lookup("alice", "drone").has_value());
  assert(grants.MayUse("drone", "bob", 0, Op("robot.move")));
  assert(grants.Size() == 1);
}

} // namespace

int main() {
  TestGrantAllowsExactlyOneSubscription();
  TestManagementOperationsAreNeverDelegable();
  TestRegrantReplacesAndRevokeRemoves();

  std::cout << "capacity_manager_unit_proxy_grant_table: pass\n";
  return 0;
}
