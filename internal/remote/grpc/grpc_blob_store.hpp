#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>

#include "internal/remote/blob_store.hpp"
#include "stockcount/remote_v1.hpp"

namespace stockcount::remote::grpc {

// Uploads the whole file in one unary call.
class GrpcBlobStore final : public BlobStore {
 public:
  GrpcBlobStore(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline);

  UploadResult UploadPhoto(const std::string& local_uri) override;

 private:
  std::unique_ptr<stockcount::remote::v1::BlobStoreService::Stub> stub_;
  std::chrono::milliseconds                                      deadline_;
};

} // namespace stockcount::remote::grpc
