#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>

#include "internal/remote/inventory_service.hpp"
#include "stockcount/remote_v1.hpp"

namespace stockcount::remote::grpc {

class GrpcInventoryService final : public InventoryService {
 public:
  GrpcInventoryService(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline);

  model::AreaSnapshot FetchAreaItems(const std::string& area_id) override;
  RemoteResult        PersistItemUpdate(const v1::ItemWrite& write) override;
  RemoteResult        CommitSession(const v1::SessionCommit& commit) override;

 private:
  std::unique_ptr<stockcount::remote::v1::InventoryService::Stub> stub_;
  std::chrono::milliseconds                                      deadline_;
};

} // namespace stockcount::remote::grpc
