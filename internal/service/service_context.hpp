#pragma once

#include <memory>
#include <mutex>

namespace capacity::core {
class AuctionManager;
class AssetLockAccountant;
class RequestInterceptor;
class Dispatcher;
} // namespace capacity::core
namespace capacity::db {
class Repository;
}
namespace capacity::events {
class EventLog;
}
namespace capacity::reservation {
class ReservationTable;
}

namespace capacity::service {

/*
  Dependency container shared by all services.

  `ordering` serializes every state-changing call so the core sees one
  operation at a time, whatever the transport's threading.
*/
struct ServiceContext {
  std::shared_ptr<capacity::core::AuctionManager>         auctions;
  std::shared_ptr<capacity::core::AssetLockAccountant>    locks;
  std::shared_ptr<capacity::core::RequestInterceptor>     interceptor;
  std::shared_ptr<capacity::core::Dispatcher>             dispatcher;
  std::shared_ptr<capacity::reservation::ReservationTable> reservations;
  std::shared_ptr<capacity::events::EventLog>             events;
  std::shared_ptr<capacity::db::Repository>               repository;
  std::shared_ptr<std::mutex>                             ordering = std::make_shared<std::mutex>();
};

} // namespace capacity::service
