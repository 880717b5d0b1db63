#pragma once

#include <chrono>
#include <string_view>

#include "internal/model/types.hpp"

namespace stockcount::session {

enum class CheckStatus : uint8_t {
  kOk      = 0,
  kDueSoon = 1,
  kOverdue = 2,
};

std::chrono::hours CheckInterval(model::CheckFrequency frequency);

/*
  overdue:  never checked, or a full interval has elapsed
  due_soon: at least 75% of the interval has elapsed
  ok:       otherwise
*/
CheckStatus CheckStatusOf(const model::StorageArea& area, util::TimePoint now);

std::string_view ToString(CheckStatus status);

} // namespace stockcount::session
