#pragma once

#include <cstdint>
#include <string>

namespace stockcount::db::model {

/*
  One unacknowledged remote write.

  payload is a serialized stockcount.core.v1.PendingPayload.
  Queue order is (created_at_ms, sequence).
*/
struct PendingUpdateRecord {
  std::string id;
  uint64_t    sequence = 0;

  std::string area_item_id;
  std::string session_id;
  std::string payload;

  uint64_t created_at_ms = 0;
  uint32_t attempts      = 0;
};

} // namespace stockcount::db::model
