#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "capacity/manager/v1.hpp"
#include "internal/service/admin_service.hpp"

namespace capacity::grpc {

class AdminServer final : public capacity::manager::v1::CapacityAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<capacity::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*, const capacity::manager::v1::StatsRequest*, capacity::manager::v1::StatsResponse*) override;

  ::grpc::Status DrainEvents(::grpc::ServerContext*, const capacity::manager::v1::DrainEventsRequest*,
                             capacity::manager::v1::DrainEventsResponse*) override;

 private:
  std::shared_ptr<capacity::service::AdminService> service_;
};

} // namespace capacity::grpc
