#include "grpc_inventory_service.hpp"

#include <grpcpp/client_context.h>

#include "grpc_status.hpp"
#include "internal/model/proto_codec.hpp"
#include "internal/util/errors.hpp"

namespace stockcount::remote::grpc {

namespace {

void ApplyDeadline(::grpc::ClientContext& context, std::chrono::milliseconds deadline) {
  context.set_deadline(std::chrono::system_clock::now() + deadline);
}

} // namespace

GrpcInventoryService::GrpcInventoryService(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(stockcount::remote::v1::InventoryService::NewStub(std::move(channel))), deadline_(deadline) {
}

model::AreaSnapshot GrpcInventoryService::FetchAreaItems(const std::string& area_id) {
  stockcount::remote::v1::FetchAreaItemsRequest  request;
  stockcount::remote::v1::FetchAreaItemsResponse response;
  request.set_area_id(area_id);

  ::grpc::ClientContext context;
  ApplyDeadline(context, deadline_);

  const auto status = stub_->FetchAreaItems(&context, request, &response);
  if (status.error_code() == ::grpc::StatusCode::NOT_FOUND) {
    throw util::NotFound("unknown area: " + area_id);
  }
  const auto result = ToRemoteResult(status, "FetchAreaItems");
  if (!result) {
    throw RemoteCallFailed(result.code, result.message);
  }
  return model::FromProto(response.snapshot());
}

RemoteResult GrpcInventoryService::PersistItemUpdate(const v1::ItemWrite& write) {
  stockcount::remote::v1::PersistItemUpdateRequest  request;
  stockcount::remote::v1::PersistItemUpdateResponse response;
  *request.mutable_write() = write;

  ::grpc::ClientContext context;
  ApplyDeadline(context, deadline_);

  return ToRemoteResult(stub_->PersistItemUpdate(&context, request, &response), "PersistItemUpdate");
}

RemoteResult GrpcInventoryService::CommitSession(const v1::SessionCommit& commit) {
  stockcount::remote::v1::CommitSessionRequest  request;
  stockcount::remote::v1::CommitSessionResponse response;
  *request.mutable_commit() = commit;

  ::grpc::ClientContext context;
  ApplyDeadline(context, deadline_);

  return ToRemoteResult(stub_->CommitSession(&context, request, &response), "CommitSession");
}

} // namespace stockcount::remote::grpc
