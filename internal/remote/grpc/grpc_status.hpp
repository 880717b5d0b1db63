#pragma once

#include <grpcpp/grpcpp.h>

#include <string_view>

#include "internal/remote/remote_result.hpp"

namespace stockcount::remote::grpc {

/*
  Converts gRPC status codes into portable remote results.
*/

RemoteError  ToRemoteError(::grpc::StatusCode code);
RemoteResult ToRemoteResult(const ::grpc::Status& status, std::string_view action);

} // namespace stockcount::remote::grpc
