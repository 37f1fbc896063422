#pragma once

#include "capacity/manager/core/v1/types.pb.h"

#include "capacity/manager/services/v1/capacity_admin_service.pb.h"
#include "capacity/manager/services/v1/capacity_auction_service.pb.h"
#include "capacity/manager/services/v1/capacity_subscription_service.pb.h"

#include "capacity/manager/services/v1/capacity_admin_service.grpc.pb.h"
#include "capacity/manager/services/v1/capacity_auction_service.grpc.pb.h"
#include "capacity/manager/services/v1/capacity_subscription_service.grpc.pb.h"

namespace capacity::manager::v1 {
using namespace ::capacity::manager::core::v1;
using namespace ::capacity::manager::services::v1;
}
