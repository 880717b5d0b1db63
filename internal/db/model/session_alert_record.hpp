#pragma once

#include <cstdint>
#include <string>

namespace stockcount::db::model {

struct SessionAlertRecord {
  std::string session_id;
  uint32_t    critical_count = 0;
  std::string title;
  std::string body;
  uint64_t    alerted_at_ms = 0;
};

} // namespace stockcount::db::model
