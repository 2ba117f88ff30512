#pragma once

#include "artscan/core/v1/types.pb.h"

#include "artscan/services/v1/admin_service.pb.h"
#include "artscan/services/v1/scan_service.pb.h"

#include "artscan/services/v1/admin_service.grpc.pb.h"
#include "artscan/services/v1/scan_service.grpc.pb.h"

namespace artscan::v1 {
using namespace ::artscan::core::v1;
using namespace ::artscan::services::v1;
}
