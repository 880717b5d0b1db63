#include "internal/session/check_schedule.hpp"

namespace stockcount::session {

std::chrono::hours CheckInterval(model::CheckFrequency frequency) {
  switch (frequency) {
    case model::CheckFrequency::kDaily:
      return std::chrono::hours(24);
    case model::CheckFrequency::kEvery2Days:
      return std::chrono::hours(48);
    case model::CheckFrequency::kEvery3Days:
      return std::chrono::hours(72);
    case model::CheckFrequency::kWeekly:
      return std::chrono::hours(24 * 7);
  }
  return std::chrono::hours(24);
}

CheckStatus CheckStatusOf(const model::StorageArea& area, util::TimePoint now) {
  if (!area.last_checked_at) {
    return CheckStatus::kOverdue;
  }

  const auto elapsed  = now - *area.last_checked_at;
  const auto interval = std::chrono::duration_cast<util::TimePoint::duration>(CheckInterval(area.check_frequency));

  if (elapsed >= interval) {
    return CheckStatus::kOverdue;
  }
  if (elapsed * 4 >= interval * 3) {
    return CheckStatus::kDueSoon;
  }
  return CheckStatus::kOk;
}

std::string_view ToString(CheckStatus status) {
  switch (status) {
    case CheckStatus::kOk:
      return "ok";
    case CheckStatus::kDueSoon:
      return "due_soon";
    case CheckStatus::kOverdue:
      return "overdue";
  }
  return "unknown";
}

} // namespace stockcount::session
