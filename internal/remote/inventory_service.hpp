#pragma once

#include <string>

#include "internal/model/types.hpp"
#include "internal/remote/remote_result.hpp"
#include "stockcount/v1.hpp"

namespace stockcount::remote {

/*
  Inventory Service port.

  FetchAreaItems throws RemoteCallFailed (or util::NotFound for an unknown
  area). Writes report failure as values so callers can keep them queued.
*/
class InventoryService {
 public:
  virtual ~InventoryService() = default;

  virtual model::AreaSnapshot FetchAreaItems(const std::string& area_id) = 0;

  virtual RemoteResult PersistItemUpdate(const v1::ItemWrite& write) = 0;

  virtual RemoteResult CommitSession(const v1::SessionCommit& commit) = 0;
};

} // namespace stockcount::remote
