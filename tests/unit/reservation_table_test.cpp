#include "internal/reservation/reservation_table.hpp"

#include <cassert>
#include <iostream>
#include <set>

namespace {

using capacity::reservation::Reservation;
using capacity::reservation::ReservationTable;

constexpr uint64_t kStart = 1'700'000'000'000ULL;

Reservation Hold(const std::string& owner, uint64_t cost) {
  Reservation r;
  r.signer         = owner;
  r.owner          = owner;
  r.estimated_cost = cost;
  return r;
}

void TestInsertAssignsIdAndExpiry() {
  auto             clock = std::make_shared<capacity::util::ManualTimeSource>(kStart);
  ReservationTable table(clock, std::chrono::seconds(60));

  const auto r = table.Insert(Hold("alice", 10));
  assert(r.id.size() == 36);
  assert(r.expires_at_ms == kStart + 60'000);
  assert(table.Contains(r.id));

  std::set<std::string> ids{r.id};
  for (int i = 0; i < 32; ++i) {
    assert(ids.insert(table.Insert(Hold("alice", 1)).id).second);
  }
  assert(table.Size() == 33);
}

void TestTakeIsSingleUse() {
  auto             clock = std::make_shared<capacity::util::ManualTimeSource>(kStart);
  ReservationTable table(clock, std::chrono::seconds(60));

  const auto r     = table.Insert(Hold("alice", 10));
  const auto taken = table.Take(r.id);
  assert(taken.has_value());
  assert(taken->owner == "alice");
  assert(taken->estimated_cost == 10);

  assert(!table.Take(r.id).has_value());
  assert(!table.Take("no-such-id").has_value());
  assert(table.Size() == 0);
}

void TestExpiredEntriesArePurged() {
  auto             clock = std::make_shared<capacity::util::ManualTimeSource>(kStart);
  ReservationTable table(clock, std::chrono::seconds(60));

  const auto early = table.Insert(Hold("alice", 1));
  clock->Advance(30'000);
  const auto late = table.Insert(Hold("bob", 1));

  clock->Advance(29'999);
  assert(table.Size() == 2);

  clock->Advance(1);
  assert(!table.Contains(early.id));
  assert(table.Contains(late.id));
  assert(!table.Take(early.id).has_value());

  clock->Advance(30'000);
  assert(table.Size() == 0);
}

} // namespace

int main() {
  TestInsertAssignsIdAndExpiry();
  TestTakeIsSingleUse();
  TestExpiredEntriesArePurged();

  std::cout << "capacity_manager_unit_reservation_table: pass\n";
  return 0;
}
