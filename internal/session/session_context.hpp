#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/network/network_monitor.hpp"
#include "internal/remote/blob_store.hpp"
#include "internal/remote/inventory_service.hpp"
#include "internal/remote/notification_service.hpp"
#include "internal/util/time.hpp"

namespace stockcount::session {

// Collaborators handed to the SessionEngine. All are required.
struct SessionContext {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<remote::InventoryService>    inventory;
  std::shared_ptr<remote::BlobStore>           blob_store;
  std::shared_ptr<remote::NotificationService> notifications;
  std::shared_ptr<network::NetworkMonitor>     network;
  std::shared_ptr<util::Clock>                 clock;
};

} // namespace stockcount::session
