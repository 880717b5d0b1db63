#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/types.hpp"
#include "internal/remote/notification_service.hpp"
#include "internal/util/time.hpp"

namespace stockcount::session {

inline constexpr double kDefaultHealthyFactor = 1.5;

/*
  critical: quantity < min
  low:      min <= quantity < min * healthy_factor
  healthy:  otherwise (including every item with min == 0)
*/
model::QuantityBand ClassifyQuantity(double quantity, double min_quantity, double healthy_factor = kDefaultHealthyFactor);

// Current band of every classified item, maintained one item at a time.
class BandIndex {
 public:
  void                               Set(const std::string& item_id, model::QuantityBand band);
  std::optional<model::QuantityBand> Get(const std::string& item_id) const;
  std::size_t                        Count(model::QuantityBand band) const;
  void                               Clear();

 private:
  std::unordered_map<std::string, model::QuantityBand> bands_;
  std::array<std::size_t, 3>                           counts_{};
};

struct BandEntry {
  std::string area_item_id;
  std::string name;

  double quantity     = 0.0;
  double min_quantity = 0.0;

  model::ItemStatus status = model::ItemStatus::kCounted;
};

enum class ReorderUrgency : uint8_t {
  kMedium = 0,
  kHigh   = 1,
};

struct ReorderSuggestion {
  std::string area_item_id;
  std::string inventory_item_id;
  std::string name;
  std::string unit_type;

  double quantity         = 0.0;
  double reorder_quantity = 0.0;

  ReorderUrgency urgency = ReorderUrgency::kMedium;
};

struct CompletionSummary {
  std::string session_id;
  std::string area_id;

  std::vector<BandEntry> critical;
  std::vector<BandEntry> low;
  std::vector<BandEntry> healthy;

  std::size_t counted_count = 0;
  std::size_t skipped_count = 0;

  // sum of |new - previous| over counted items
  double      total_quantity_changed = 0.0;
  std::size_t updated_items_count    = 0;

  std::vector<ReorderSuggestion> reorder;

  bool alert_sent = false;
};

/*
  Builds the completion summary and raises the critical-stock alert.

  Summarize() is pure. NotifyIfCritical() records the alert in the
  Repository in the transaction that schedules it, so one session alerts
  at most once even if completion is replayed. A notifier failure is
  logged and leaves no record behind.
*/
class CompletionAggregator {
 public:
  CompletionAggregator(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::NotificationService> notifications,
                       std::shared_ptr<util::Clock> clock, double healthy_factor = kDefaultHealthyFactor);

  // items in queue order; skipped items are classified by their previous quantity
  CompletionSummary Summarize(const std::string& session_id, const std::string& area_id, const std::vector<model::AreaItem>& items,
                              const std::map<std::string, model::SessionItemUpdate>& updates) const;

  // Returns true when this call scheduled the alert. Throws StorageError only.
  bool NotifyIfCritical(CompletionSummary& summary, const std::string& area_name);

  double HealthyFactor() const {
    return healthy_factor_;
  }

 private:
  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<remote::NotificationService> notifications_;
  std::shared_ptr<util::Clock>                 clock_;
  double                                       healthy_factor_;
};

std::string_view ToString(ReorderUrgency urgency);

} // namespace stockcount::session
