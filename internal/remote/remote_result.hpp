#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace stockcount::remote {

/*
  Portable remote failure codes.

  Adapters translate transport errors into these. Upper layers never
  depend on gRPC status types.
*/

enum class RemoteError {
  OK = 0,

  Unavailable,
  DeadlineExceeded,
  Rejected,
  NotFound,

  Internal
};

struct RemoteResult {
  RemoteError code = RemoteError::OK;
  std::string message;

  static RemoteResult Ok() {
    return {};
  }

  static RemoteResult Err(RemoteError c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == RemoteError::OK;
  }
};

struct UploadResult {
  RemoteResult status;
  std::string  url;
};

// Thrown by calls that return data (FetchAreaItems).
class RemoteCallFailed : public std::runtime_error {
 public:
  RemoteCallFailed(RemoteError code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  RemoteError Code() const {
    return code_;
  }

 private:
  RemoteError code_;
};

constexpr std::string_view ToString(RemoteError code) {
  switch (code) {
    case RemoteError::OK:
      return "ok";
    case RemoteError::Unavailable:
      return "unavailable";
    case RemoteError::DeadlineExceeded:
      return "deadline_exceeded";
    case RemoteError::Rejected:
      return "rejected";
    case RemoteError::NotFound:
      return "not_found";
    case RemoteError::Internal:
      return "internal";
  }
  return "unknown";
}

} // namespace stockcount::remote
