#pragma once

#include <string>

#include "internal/remote/remote_result.hpp"

namespace stockcount::remote {

class BlobStore {
 public:
  virtual ~BlobStore() = default;

  // local_uri is a path or a file:// URI on this device.
  virtual UploadResult UploadPhoto(const std::string& local_uri) = 0;
};

} // namespace stockcount::remote
