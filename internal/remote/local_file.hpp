#pragma once

#include <filesystem>
#include <string>

namespace stockcount::remote {

// Accepts a plain path or a file:// URI. Throws util::ValidationError on anything else.
std::filesystem::path LocalPathFromUri(const std::string& local_uri);

// Throws std::runtime_error when the file cannot be read.
std::string ReadFileBytes(const std::filesystem::path& path);

// image/jpeg, image/png, image/heic, otherwise application/octet-stream
std::string ContentTypeFor(const std::filesystem::path& path);

} // namespace stockcount::remote
