#include "internal/notify/log_notification_service.hpp"

#include "internal/observability/logging.hpp"

namespace stockcount::notify {

void LogNotificationService::ScheduleLocalAlert(const std::string& title, const std::string& body) {
  STOCKCOUNT_LOG_WARN("local alert", {observability::StringField("title", title), observability::StringField("body", body)});
}

} // namespace stockcount::notify
