#include "internal/remote/fixture/directory_blob_store.hpp"

#include <system_error>

#include "internal/remote/local_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace stockcount::remote::fixture {

DirectoryBlobStore::DirectoryBlobStore(std::filesystem::path root) : root_(std::move(root)) {
}

UploadResult DirectoryBlobStore::UploadPhoto(const std::string& local_uri) {
  std::filesystem::path source;
  try {
    source = LocalPathFromUri(local_uri);
  } catch (const util::ValidationError& e) {
    return {RemoteResult::Err(RemoteError::Rejected, e.what()), {}};
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    return {RemoteResult::Err(RemoteError::NotFound, "photo not found: " + source.string()), {}};
  }

  std::filesystem::create_directories(root_, ec);
  if (ec) {
    return {RemoteResult::Err(RemoteError::Unavailable, "cannot create " + root_.string() + ": " + ec.message()), {}};
  }

  const auto target = root_ / (util::NewId() + "-" + source.filename().string());
  std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    return {RemoteResult::Err(RemoteError::Internal, "copy failed: " + ec.message()), {}};
  }

  return {RemoteResult::Ok(), "file://" + std::filesystem::absolute(target).string()};
}

} // namespace stockcount::remote::fixture
