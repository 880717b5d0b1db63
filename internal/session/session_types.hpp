#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stockcount::session {

// Non-fatal problems attached to a recorded decision.
enum class DecisionWarning : uint8_t {
  kPhotoUnavailableOffline = 0,
  kPhotoUploadFailed       = 1,
};

constexpr std::string_view ToString(DecisionWarning warning) {
  return warning == DecisionWarning::kPhotoUnavailableOffline ? "photo_unavailable_offline" : "photo_upload_failed";
}

struct DecisionOptions {
  std::optional<std::string> note;
  std::optional<std::string> photo_uri;
};

struct DecisionOutcome {
  std::vector<DecisionWarning> warnings;

  std::size_t pending_count = 0;

  // the write was acknowledged before the call returned
  bool synced = false;
};

struct EngineOptions {
  std::string device_id = "local-device";

  double   healthy_factor      = 1.5;
  uint32_t skip_hint_threshold = 2;
};

} // namespace stockcount::session
