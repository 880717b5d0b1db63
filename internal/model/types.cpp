#include "internal/model/types.hpp"

namespace stockcount::model {

std::string_view ToString(UpdateMethod method) {
  switch (method) {
    case UpdateMethod::kManual:
      return "manual";
    case UpdateMethod::kNfc:
      return "nfc";
    case UpdateMethod::kQr:
      return "qr";
  }
  return "unknown";
}

std::optional<UpdateMethod> ParseUpdateMethod(std::string_view text) {
  if (text == "manual") return UpdateMethod::kManual;
  if (text == "nfc") return UpdateMethod::kNfc;
  if (text == "qr") return UpdateMethod::kQr;
  return std::nullopt;
}

std::string_view ToString(CheckFrequency frequency) {
  switch (frequency) {
    case CheckFrequency::kDaily:
      return "daily";
    case CheckFrequency::kEvery2Days:
      return "every_2_days";
    case CheckFrequency::kEvery3Days:
      return "every_3_days";
    case CheckFrequency::kWeekly:
      return "weekly";
  }
  return "unknown";
}

std::optional<CheckFrequency> ParseCheckFrequency(std::string_view text) {
  if (text == "daily") return CheckFrequency::kDaily;
  if (text == "every_2_days") return CheckFrequency::kEvery2Days;
  if (text == "every_3_days") return CheckFrequency::kEvery3Days;
  if (text == "weekly") return CheckFrequency::kWeekly;
  return std::nullopt;
}

std::string_view ToString(ItemStatus status) {
  return status == ItemStatus::kCounted ? "counted" : "skipped";
}

std::string_view ToString(QuantityBand band) {
  switch (band) {
    case QuantityBand::kCritical:
      return "critical";
    case QuantityBand::kLow:
      return "low";
    case QuantityBand::kHealthy:
      return "healthy";
  }
  return "unknown";
}

} // namespace stockcount::model
