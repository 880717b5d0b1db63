#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace stockcount::util {

/*
  Time utilities.

  The engine never reads the system clock directly; it is handed a Clock
  so tests can drive time deterministically.
*/

using TimePoint = std::chrono::system_clock::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// RFC 3339 / ISO-8601 in UTC, millisecond precision ("2026-10-19T08:15:00.000Z").
std::string FormatIso8601(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]". Throws ValidationError.
TimePoint ParseIso8601(std::string_view text);

} // namespace stockcount::util
