#include "internal/session/check_schedule.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>

#include "internal/util/time.hpp"

namespace {

using namespace std::chrono_literals;
using stockcount::model::CheckFrequency;
using stockcount::model::StorageArea;
using stockcount::session::CheckStatus;
using stockcount::session::CheckStatusOf;

StorageArea Area(CheckFrequency frequency, std::optional<stockcount::util::TimePoint> last_checked) {
  StorageArea area;
  area.id              = "area";
  area.name            = "Area";
  area.check_frequency = frequency;
  area.last_checked_at = last_checked;
  return area;
}

void TestNeverCheckedIsOverdue() {
  assert(CheckStatusOf(Area(CheckFrequency::kWeekly, std::nullopt), stockcount::util::Now()) == CheckStatus::kOverdue);
}

void TestDailyThresholds() {
  const auto checked = stockcount::util::ParseIso8601("2026-10-18T06:00:00Z");
  const auto area    = Area(CheckFrequency::kDaily, checked);

  assert(CheckStatusOf(area, checked + 1h) == CheckStatus::kOk);
  assert(CheckStatusOf(area, checked + 17h) == CheckStatus::kOk);
  assert(CheckStatusOf(area, checked + 18h) == CheckStatus::kDueSoon);
  assert(CheckStatusOf(area, checked + 23h) == CheckStatus::kDueSoon);
  assert(CheckStatusOf(area, checked + 24h) == CheckStatus::kOverdue);
}

void TestIntervals() {
  assert(stockcount::session::CheckInterval(CheckFrequency::kEvery2Days) == 48h);
  assert(stockcount::session::CheckInterval(CheckFrequency::kEvery3Days) == 72h);
  assert(stockcount::session::CheckInterval(CheckFrequency::kWeekly) == 168h);

  const auto checked = stockcount::util::ParseIso8601("2026-10-10T00:00:00Z");
  assert(CheckStatusOf(Area(CheckFrequency::kWeekly, checked), checked + 120h) == CheckStatus::kOk);
  assert(CheckStatusOf(Area(CheckFrequency::kWeekly, checked), checked + 130h) == CheckStatus::kDueSoon);
}

void TestStatusNames() {
  assert(stockcount::session::ToString(CheckStatus::kDueSoon) == "due_soon");
  assert(stockcount::session::ToString(CheckStatus::kOverdue) == "overdue");
}

} // namespace

int main() {
  TestNeverCheckedIsOverdue();
  TestDailyThresholds();
  TestIntervals();
  TestStatusNames();

  std::cout << "stockcount_unit_check_schedule: pass\n";
  return 0;
}
