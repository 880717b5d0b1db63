#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace stockcount::model {

enum class UpdateMethod : std::uint8_t {
  kManual = 0,
  kNfc = 1,
  kQr = 2,
};

enum class CheckFrequency : std::uint8_t {
  kDaily = 0,
  kEvery2Days = 1,
  kEvery3Days = 2,
  kWeekly = 3,
};

enum class ItemStatus : std::uint8_t {
  kCounted = 0,
  kSkipped = 1,
};

enum class QuantityBand : std::uint8_t {
  kCritical = 0,
  kLow = 1,
  kHealthy = 2,
};

/*
  A physical counting zone. Immutable for the duration of a session.
*/
struct StorageArea {
  std::string id;
  std::string name;

  CheckFrequency           check_frequency = CheckFrequency::kDaily;
  std::optional<util::TimePoint> last_checked_at;
};

/*
  A countable line in an area. Quantities are non-negative.
  max_quantity == 0 means no upper target is configured.
*/
struct AreaItem {
  std::string id;
  std::string inventory_item_id;
  std::string name;
  std::string category;
  std::string unit_type;

  double current_quantity = 0.0;
  double min_quantity = 0.0;
  double max_quantity = 0.0;
};

struct AreaSnapshot {
  StorageArea           area;
  std::vector<AreaItem> items;
};

/*
  The decision recorded for one item in one session.
  For skipped items new_quantity mirrors previous_quantity.
*/
struct SessionItemUpdate {
  std::string area_item_id;

  double previous_quantity = 0.0;
  double new_quantity = 0.0;

  ItemStatus   status = ItemStatus::kCounted;
  UpdateMethod method = UpdateMethod::kManual;

  std::optional<std::string> note;
  std::optional<std::string> photo_url;
};

struct StockSession {
  std::string id;
  std::string area_id;

  SessionStatus   status = SessionStatus::kNotStarted;
  UpdateMethod    method = UpdateMethod::kManual;
  util::TimePoint started_at{};

  std::uint32_t items_checked = 0;
  std::uint32_t items_skipped = 0;
  std::uint32_t items_total = 0;
  std::size_t   cursor = 0;
};

std::string_view              ToString(UpdateMethod method);
std::optional<UpdateMethod>   ParseUpdateMethod(std::string_view text);
std::string_view              ToString(CheckFrequency frequency);
std::optional<CheckFrequency> ParseCheckFrequency(std::string_view text);
std::string_view              ToString(ItemStatus status);
std::string_view              ToString(QuantityBand band);

} // namespace stockcount::model
