#pragma once

#include "stockcount/v1.hpp"

#include "stockcount/remote/v1/inventory_service.pb.h"
#include "stockcount/remote/v1/inventory_service.grpc.pb.h"

namespace stockcount::remote::v1 {
using namespace ::stockcount::core::v1;
}
