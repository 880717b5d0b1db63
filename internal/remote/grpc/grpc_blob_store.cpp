#include "grpc_blob_store.hpp"

#include <grpcpp/client_context.h>

#include <stdexcept>

#include "grpc_status.hpp"
#include "internal/remote/local_file.hpp"
#include "internal/util/errors.hpp"

namespace stockcount::remote::grpc {

GrpcBlobStore::GrpcBlobStore(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(stockcount::remote::v1::BlobStoreService::NewStub(std::move(channel))), deadline_(deadline) {
}

UploadResult GrpcBlobStore::UploadPhoto(const std::string& local_uri) {
  stockcount::remote::v1::UploadPhotoRequest  request;
  stockcount::remote::v1::UploadPhotoResponse response;

  try {
    const auto path = LocalPathFromUri(local_uri);
    request.set_file_name(path.filename().string());
    request.set_content_type(ContentTypeFor(path));
    request.set_data(ReadFileBytes(path));
  } catch (const util::ValidationError& e) {
    return {RemoteResult::Err(RemoteError::Rejected, e.what()), {}};
  } catch (const std::runtime_error& e) {
    return {RemoteResult::Err(RemoteError::NotFound, e.what()), {}};
  }

  ::grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + deadline_);

  auto result = ToRemoteResult(stub_->UploadPhoto(&context, request, &response), "UploadPhoto");
  if (!result) {
    return {std::move(result), {}};
  }
  return {RemoteResult::Ok(), response.url()};
}

} // namespace stockcount::remote::grpc
