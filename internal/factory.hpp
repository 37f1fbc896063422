#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace capacity::core {
class AuctionManager;
class AssetLockAccountant;
class QuotaAccountant;
class RequestInterceptor;
class JournalDispatcher;
} // namespace capacity::core
namespace capacity::currency {
class MemoryCurrency;
}
namespace capacity::db {
class Repository;
}
namespace capacity::delegation {
class ProxyGrantTable;
}
namespace capacity::events {
class EventLog;
}
namespace capacity::reservation {
class ReservationTable;
}
namespace capacity::util {
class TimeSource;
}

namespace capacity::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<const util::TimeSource>          clock;
  std::shared_ptr<db::Repository>                  repository;
  std::shared_ptr<currency::MemoryCurrency>        currency;
  std::shared_ptr<events::EventLog>                events;
  std::shared_ptr<delegation::ProxyGrantTable>     grants;
  std::shared_ptr<reservation::ReservationTable>   reservations;
  std::shared_ptr<core::QuotaAccountant>           quota;
  std::shared_ptr<core::AuctionManager>            auctions;
  std::shared_ptr<core::AssetLockAccountant>       locks;
  std::shared_ptr<core::RequestInterceptor>        interceptor;
  std::shared_ptr<core::JournalDispatcher>         dispatcher;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Constructs the repository selected by config and brings its schema up to
  date. This is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const capacity::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config. `clock` defaults to
  the system clock.
*/
Application Build(const capacity::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::TimeSource> clock = nullptr);

} // namespace capacity::factory
