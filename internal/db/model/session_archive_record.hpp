#pragma once

#include <cstdint>
#include <string>

namespace stockcount::db::model {

/*
  Finished session history (completed or abandoned).
  status holds model::ToString(SessionStatus).
*/
struct SessionArchiveRecord {
  std::string session_id;
  std::string area_id;
  std::string status;

  uint64_t started_at_ms  = 0;
  uint64_t finished_at_ms = 0;

  uint32_t items_checked = 0;
  uint32_t items_skipped = 0;
  uint32_t items_total   = 0;

  uint32_t critical_count = 0;
  uint32_t low_count      = 0;
  uint32_t healthy_count  = 0;
};

} // namespace stockcount::db::model
