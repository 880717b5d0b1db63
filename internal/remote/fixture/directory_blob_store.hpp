#pragma once

#include <filesystem>

#include "internal/remote/blob_store.hpp"

namespace stockcount::remote::fixture {

/*
  BlobStore that copies photos into a local directory and hands back a
  file:// URL. Stands in for the remote store when no endpoint is configured.
*/
class DirectoryBlobStore final : public BlobStore {
 public:
  explicit DirectoryBlobStore(std::filesystem::path root);

  UploadResult UploadPhoto(const std::string& local_uri) override;

 private:
  std::filesystem::path root_;
};

} // namespace stockcount::remote::fixture
