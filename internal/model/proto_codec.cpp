#include "internal/model/proto_codec.hpp"

#include "internal/util/time.hpp"

namespace stockcount::model {

v1::UpdateMethod ToProto(UpdateMethod method) {
  switch (method) {
    case UpdateMethod::kManual:
      return v1::UPDATE_METHOD_MANUAL;
    case UpdateMethod::kNfc:
      return v1::UPDATE_METHOD_NFC;
    case UpdateMethod::kQr:
      return v1::UPDATE_METHOD_QR;
  }
  return v1::UPDATE_METHOD_UNSPECIFIED;
}

UpdateMethod FromProto(v1::UpdateMethod method) {
  switch (method) {
    case v1::UPDATE_METHOD_NFC:
      return UpdateMethod::kNfc;
    case v1::UPDATE_METHOD_QR:
      return UpdateMethod::kQr;
    default:
      return UpdateMethod::kManual;
  }
}

v1::CheckFrequency ToProto(CheckFrequency frequency) {
  switch (frequency) {
    case CheckFrequency::kDaily:
      return v1::CHECK_FREQUENCY_DAILY;
    case CheckFrequency::kEvery2Days:
      return v1::CHECK_FREQUENCY_EVERY_2_DAYS;
    case CheckFrequency::kEvery3Days:
      return v1::CHECK_FREQUENCY_EVERY_3_DAYS;
    case CheckFrequency::kWeekly:
      return v1::CHECK_FREQUENCY_WEEKLY;
  }
  return v1::CHECK_FREQUENCY_UNSPECIFIED;
}

CheckFrequency FromProto(v1::CheckFrequency frequency) {
  switch (frequency) {
    case v1::CHECK_FREQUENCY_EVERY_2_DAYS:
      return CheckFrequency::kEvery2Days;
    case v1::CHECK_FREQUENCY_EVERY_3_DAYS:
      return CheckFrequency::kEvery3Days;
    case v1::CHECK_FREQUENCY_WEEKLY:
      return CheckFrequency::kWeekly;
    default:
      return CheckFrequency::kDaily;
  }
}

v1::ItemUpdateStatus ToProto(ItemStatus status) {
  return status == ItemStatus::kSkipped ? v1::ITEM_UPDATE_STATUS_SKIPPED : v1::ITEM_UPDATE_STATUS_COUNTED;
}

ItemStatus FromProto(v1::ItemUpdateStatus status) {
  return status == v1::ITEM_UPDATE_STATUS_SKIPPED ? ItemStatus::kSkipped : ItemStatus::kCounted;
}

v1::StorageArea ToProto(const StorageArea& area) {
  v1::StorageArea out;
  out.set_id(area.id);
  out.set_name(area.name);
  out.set_check_frequency(ToProto(area.check_frequency));
  if (area.last_checked_at) {
    *out.mutable_last_checked_at() = util::ToProto(*area.last_checked_at);
  }
  return out;
}

StorageArea FromProto(const v1::StorageArea& area) {
  StorageArea out;
  out.id              = area.id();
  out.name            = area.name();
  out.check_frequency = FromProto(area.check_frequency());
  if (area.has_last_checked_at()) {
    out.last_checked_at = util::FromProto(area.last_checked_at());
  }
  return out;
}

v1::AreaItem ToProto(const AreaItem& item) {
  v1::AreaItem out;
  out.set_id(item.id);
  out.set_inventory_item_id(item.inventory_item_id);
  out.set_name(item.name);
  out.set_category(item.category);
  out.set_unit_type(item.unit_type);
  out.set_current_quantity(item.current_quantity);
  out.set_min_quantity(item.min_quantity);
  out.set_max_quantity(item.max_quantity);
  return out;
}

AreaItem FromProto(const v1::AreaItem& item) {
  AreaItem out;
  out.id                = item.id();
  out.inventory_item_id = item.inventory_item_id();
  out.name              = item.name();
  out.category          = item.category();
  out.unit_type         = item.unit_type();
  out.current_quantity  = item.current_quantity();
  out.min_quantity      = item.min_quantity();
  out.max_quantity      = item.max_quantity();
  return out;
}

v1::AreaSnapshot ToProto(const AreaSnapshot& snapshot) {
  v1::AreaSnapshot out;
  *out.mutable_area() = ToProto(snapshot.area);
  for (const auto& item : snapshot.items) {
    *out.add_items() = ToProto(item);
  }
  return out;
}

AreaSnapshot FromProto(const v1::AreaSnapshot& snapshot) {
  AreaSnapshot out;
  out.area = FromProto(snapshot.area());
  out.items.reserve(static_cast<std::size_t>(snapshot.items_size()));
  for (const auto& item : snapshot.items()) {
    out.items.push_back(FromProto(item));
  }
  return out;
}

v1::SessionItemUpdate ToProto(const SessionItemUpdate& update) {
  v1::SessionItemUpdate out;
  out.set_area_item_id(update.area_item_id);
  out.set_previous_quantity(update.previous_quantity);
  out.set_new_quantity(update.new_quantity);
  out.set_status(ToProto(update.status));
  out.set_method(ToProto(update.method));
  if (update.note) out.set_note(*update.note);
  if (update.photo_url) out.set_photo_url(*update.photo_url);
  return out;
}

SessionItemUpdate FromProto(const v1::SessionItemUpdate& update) {
  SessionItemUpdate out;
  out.area_item_id      = update.area_item_id();
  out.previous_quantity = update.previous_quantity();
  out.new_quantity      = update.new_quantity();
  out.status            = FromProto(update.status());
  out.method            = FromProto(update.method());
  if (!update.note().empty()) out.note = update.note();
  if (!update.photo_url().empty()) out.photo_url = update.photo_url();
  return out;
}

} // namespace stockcount::model
