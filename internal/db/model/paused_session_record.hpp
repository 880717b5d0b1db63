#pragma once

#include <cstdint>
#include <string>

namespace stockcount::db::model {

// snapshot is a serialized stockcount.core.v1.SessionSnapshot. One row per area.
struct PausedSessionRecord {
  std::string area_id;
  std::string session_id;
  std::string snapshot;

  uint64_t    paused_at_ms = 0;
  std::string return_location_id;
};

} // namespace stockcount::db::model
