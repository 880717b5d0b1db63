#include "internal/session/completion_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

#include "internal/observability/logging.hpp"

namespace stockcount::session {

model::QuantityBand ClassifyQuantity(double quantity, double min_quantity, double healthy_factor) {
  if (quantity < min_quantity) {
    return model::QuantityBand::kCritical;
  }
  if (quantity < min_quantity * healthy_factor) {
    return model::QuantityBand::kLow;
  }
  return model::QuantityBand::kHealthy;
}

void BandIndex::Set(const std::string& item_id, model::QuantityBand band) {
  auto [it, inserted] = bands_.try_emplace(item_id, band);
  if (!inserted) {
    --counts_[static_cast<std::size_t>(it->second)];
    it->second = band;
  }
  ++counts_[static_cast<std::size_t>(band)];
}

std::optional<model::QuantityBand> BandIndex::Get(const std::string& item_id) const {
  auto it = bands_.find(item_id);
  if (it == bands_.end()) return std::nullopt;
  return it->second;
}

std::size_t BandIndex::Count(model::QuantityBand band) const {
  return counts_[static_cast<std::size_t>(band)];
}

void BandIndex::Clear() {
  bands_.clear();
  counts_ = {};
}

CompletionAggregator::CompletionAggregator(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::NotificationService> notifications,
                                           std::shared_ptr<util::Clock> clock, double healthy_factor)
    : repository_(std::move(repository)), notifications_(std::move(notifications)), clock_(std::move(clock)), healthy_factor_(healthy_factor) {
}

CompletionSummary CompletionAggregator::Summarize(const std::string& session_id, const std::string& area_id,
                                                  const std::vector<model::AreaItem>&                    items,
                                                  const std::map<std::string, model::SessionItemUpdate>& updates) const {
  CompletionSummary summary;
  summary.session_id = session_id;
  summary.area_id    = area_id;

  for (const auto& item : items) {
    BandEntry entry;
    entry.area_item_id = item.id;
    entry.name         = item.name;
    entry.min_quantity = item.min_quantity;
    entry.quantity     = item.current_quantity;

    auto update = updates.find(item.id);
    if (update != updates.end()) {
      entry.status = update->second.status;
      if (update->second.status == model::ItemStatus::kCounted) {
        entry.quantity = update->second.new_quantity;
        ++summary.counted_count;

        const double delta = update->second.new_quantity - update->second.previous_quantity;
        summary.total_quantity_changed += std::fabs(delta);
        if (delta != 0.0) ++summary.updated_items_count;
      } else {
        entry.quantity = update->second.previous_quantity;
        ++summary.skipped_count;
      }
    }

    switch (ClassifyQuantity(entry.quantity, entry.min_quantity, healthy_factor_)) {
      case model::QuantityBand::kCritical: {
        ReorderSuggestion suggestion;
        suggestion.area_item_id      = item.id;
        suggestion.inventory_item_id = item.inventory_item_id;
        suggestion.name              = item.name;
        suggestion.unit_type         = item.unit_type;
        suggestion.quantity          = entry.quantity;
        suggestion.reorder_quantity  = std::max(item.max_quantity - entry.quantity, 0.0);
        suggestion.urgency           = entry.quantity <= 0.0 ? ReorderUrgency::kHigh : ReorderUrgency::kMedium;
        summary.reorder.push_back(std::move(suggestion));
        summary.critical.push_back(std::move(entry));
        break;
      }
      case model::QuantityBand::kLow:
        summary.low.push_back(std::move(entry));
        break;
      case model::QuantityBand::kHealthy:
        summary.healthy.push_back(std::move(entry));
        break;
    }
  }

  return summary;
}

bool CompletionAggregator::NotifyIfCritical(CompletionSummary& summary, const std::string& area_name) {
  if (summary.critical.empty()) {
    return false;
  }

  const auto count = summary.critical.size();

  db::model::SessionAlertRecord record;
  record.session_id     = summary.session_id;
  record.critical_count = static_cast<uint32_t>(count);
  record.title          = "Critical stock: " + area_name;
  record.body           = std::to_string(count) + (count == 1 ? " item is" : " items are") + " below minimum";
  record.alerted_at_ms  = util::ToUnixMillis(clock_->Now());

  // the record commits only once the alert is scheduled; a failed schedule rolls it back
  auto tx  = repository_->Begin();
  auto res = repository_->InsertSessionAlert(*tx, record);
  if (res.code == db::ErrorCode::AlreadyExists) {
    STOCKCOUNT_LOG_INFO("critical alert already sent", {observability::StringField("session_id", summary.session_id)});
    summary.alert_sent = true;
    return false;
  }
  db::ThrowIfFailed(res, "record session alert");

  try {
    notifications_->ScheduleLocalAlert(record.title, record.body);
  } catch (const std::exception& e) {
    STOCKCOUNT_LOG_WARN("critical alert not scheduled", {observability::StringField("session_id", summary.session_id),
                                                          observability::StringField("error", e.what())});
    summary.alert_sent = false;
    return false;
  }
  tx->Commit();
  summary.alert_sent = true;

  STOCKCOUNT_LOG_INFO("critical alert scheduled", {observability::StringField("session_id", summary.session_id),
                                                   observability::IntField("critical", static_cast<int64_t>(count))});
  return true;
}

std::string_view ToString(ReorderUrgency urgency) {
  return urgency == ReorderUrgency::kHigh ? "high" : "medium";
}

} // namespace stockcount::session
