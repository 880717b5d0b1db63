#pragma once

#include "internal/remote/notification_service.hpp"

namespace stockcount::notify {

// Delivers alerts to the log. Used on devices without a notification backend.
class LogNotificationService final : public remote::NotificationService {
 public:
  void ScheduleLocalAlert(const std::string& title, const std::string& body) override;
};

} // namespace stockcount::notify
