#pragma once

#include <cstdint>
#include <string_view>

namespace stockcount::model {

enum class SessionStatus : std::uint8_t {
  kNotStarted = 0,
  kActive = 1,
  kPaused = 2,
  kCompleted = 3,
  kAbandoned = 4,
};

constexpr bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kCompleted || status == SessionStatus::kAbandoned;
}

// NotStarted -> Active <-> Paused, Active -> Completed, Active|Paused -> Abandoned.
constexpr bool CanTransition(SessionStatus from, SessionStatus to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (to) {
    case SessionStatus::kActive:
      return from == SessionStatus::kNotStarted || from == SessionStatus::kPaused;
    case SessionStatus::kPaused:
      return from == SessionStatus::kActive;
    case SessionStatus::kCompleted:
      return from == SessionStatus::kActive;
    case SessionStatus::kAbandoned:
      return from == SessionStatus::kActive || from == SessionStatus::kPaused;
    case SessionStatus::kNotStarted:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::kNotStarted:
      return "not_started";
    case SessionStatus::kActive:
      return "active";
    case SessionStatus::kPaused:
      return "paused";
    case SessionStatus::kCompleted:
      return "completed";
    case SessionStatus::kAbandoned:
      return "abandoned";
  }
  return "unknown";
}

} // namespace stockcount::model
