#include "grpc_status.hpp"

#include <string>

namespace stockcount::remote::grpc {

RemoteError ToRemoteError(::grpc::StatusCode code) {
  switch (code) {
    case ::grpc::StatusCode::OK:
      return RemoteError::OK;
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::CANCELLED:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
    case ::grpc::StatusCode::ABORTED:
      return RemoteError::Unavailable;
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return RemoteError::DeadlineExceeded;
    case ::grpc::StatusCode::NOT_FOUND:
      return RemoteError::NotFound;
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
    case ::grpc::StatusCode::ALREADY_EXISTS:
    case ::grpc::StatusCode::OUT_OF_RANGE:
    case ::grpc::StatusCode::PERMISSION_DENIED:
    case ::grpc::StatusCode::UNAUTHENTICATED:
      return RemoteError::Rejected;
    default:
      return RemoteError::Internal;
  }
}

RemoteResult ToRemoteResult(const ::grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return RemoteResult::Ok();
  }
  return RemoteResult::Err(ToRemoteError(status.error_code()), std::string(action) + " failed: " + status.error_message());
}

} // namespace stockcount::remote::grpc
