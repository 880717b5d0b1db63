#pragma once

#include "stockcount/core/v1/types.pb.h"

namespace stockcount::v1 {
using namespace ::stockcount::core::v1;
}
