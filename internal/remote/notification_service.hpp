#pragma once

#include <string>

namespace stockcount::remote {

// Fire-and-forget local alerts. Implementations must not throw.
class NotificationService {
 public:
  virtual ~NotificationService() = default;

  virtual void ScheduleLocalAlert(const std::string& title, const std::string& body) = 0;
};

} // namespace stockcount::remote
