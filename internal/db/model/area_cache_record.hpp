#pragma once

#include <cstdint>
#include <string>

namespace stockcount::db::model {

// Last successfully fetched area contents (serialized stockcount.core.v1.AreaSnapshot).
struct AreaCacheRecord {
  std::string area_id;
  std::string snapshot;
  uint64_t    fetched_at_ms = 0;
};

} // namespace stockcount::db::model
