#pragma once

#include "chartsync/core/v1/resource.pb.h"
#include "chartsync/journal/v1/local_change.pb.h"

#include "chartsync/services/v1/remote_store_service.pb.h"
#include "chartsync/services/v1/remote_store_service.grpc.pb.h"

namespace chartsync::v1 {
using namespace ::chartsync::core::v1;
using namespace ::chartsync::journal::v1;
using namespace ::chartsync::services::v1;
}
