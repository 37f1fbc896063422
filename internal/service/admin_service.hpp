#pragma once

#include "capacity/manager/v1.hpp"
#include "service_context.hpp"

namespace capacity::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  capacity::manager::v1::StatsResponse Stats(const capacity::manager::v1::StatsRequest& req);

  capacity::manager::v1::DrainEventsResponse DrainEvents(const capacity::manager::v1::DrainEventsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace capacity::service
