#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace capacity::grpc {

AdminServer::AdminServer(std::shared_ptr<capacity::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const capacity::manager::v1::StatsRequest* req, capacity::manager::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::DrainEvents(::grpc::ServerContext*, const capacity::manager::v1::DrainEventsRequest* req,
                                        capacity::manager::v1::DrainEventsResponse* resp) {
  try {
    *resp = service_->DrainEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace capacity::grpc
