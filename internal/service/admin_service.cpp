#include "admin_service.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/events/event_log.hpp"
#include "internal/reservation/reservation_table.hpp"
#include "internal/util/saturating.hpp"
#include "observe_rpc.hpp"

namespace capacity::service {

using namespace capacity::manager::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", [&] {
    StatsResponse resp;

    auto       tx            = ctx_.repository->Begin();
    const auto auctions      = ctx_.repository->ListAuctions(*tx);
    const auto subscriptions = ctx_.repository->ListAllSubscriptions(*tx);
    const auto locked        = ctx_.repository->ListLockedAssets(*tx);
    tx->Rollback();

    uint64_t claimed = 0;
    for (const auto& auction : auctions) {
      if (auction.subscription_id) {
        ++claimed;
      }
    }

    uint64_t locked_total = 0;
    for (const auto& row : locked) {
      locked_total = capacity::util::SaturatingAdd(locked_total, row.amount);
    }

    resp.set_auctions(auctions.size());
    resp.set_auctions_claimed(claimed);
    resp.set_subscriptions(subscriptions.size());
    resp.set_lock_backed(locked.size());
    resp.set_locked_total(locked_total);
    resp.set_open_reservations(ctx_.reservations ? ctx_.reservations->Size() : 0);
    return resp;
  });
}

DrainEventsResponse AdminService::DrainEvents(const DrainEventsRequest&) {
  return ObserveRpc("AdminService.DrainEvents", [&] {
    DrainEventsResponse resp;
    if (!ctx_.events) {
      return resp;
    }
    for (auto& event : ctx_.events->Drain()) {
      *resp.add_events() = std::move(event);
    }
    return resp;
  });
}

} // namespace capacity::service
