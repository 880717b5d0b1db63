#include "internal/remote/local_file.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace stockcount::remote {

std::filesystem::path LocalPathFromUri(const std::string& local_uri) {
  static constexpr std::string_view kFileScheme = "file://";

  if (local_uri.empty()) {
    throw util::ValidationError("photo uri must not be empty");
  }
  if (local_uri.rfind(kFileScheme, 0) == 0) {
    return std::filesystem::path(local_uri.substr(kFileScheme.size()));
  }
  if (local_uri.find("://") != std::string::npos) {
    throw util::ValidationError("unsupported photo uri scheme: " + local_uri);
  }
  return std::filesystem::path(local_uri);
}

std::string ReadFileBytes(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path.string());
  }
  std::ostringstream out;
  out << in.rdbuf();
  if (in.bad()) {
    throw std::runtime_error("read failed on " + path.string());
  }
  return out.str();
}

std::string ContentTypeFor(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
  if (ext == ".png") return "image/png";
  if (ext == ".heic") return "image/heic";
  return "application/octet-stream";
}

} // namespace stockcount::remote
