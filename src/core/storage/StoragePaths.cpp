#include "StoragePaths.hpp"

#include "core/errors/ServiceError.hpp"

namespace {

const std::string& segment(const std::string& s, const char* what) {
  if (s.empty() || s == "." || s == ".." ||
      s.find_first_of("/\\") != std::string::npos) {
    throw wam::ValidationError(std::string("invalid ") + what + ": " + s);
  }
  return s;
}

} // namespace

namespace wam {

std::string originalPath(const std::string& ownerId, int64_t timestampMs, const std::string& ext) {
  return "original/" + segment(ownerId, "owner id") + "/" + std::to_string(timestampMs) + "." + ext;
}

std::string processedPath(const std::string& ownerId, const std::string& key, const std::string& ext) {
  return "processed/" + segment(ownerId, "owner id") + "/" + segment(key, "asset id") + "." + ext;
}

std::string generatedPath(const std::string& ownerId, const std::string& assetId, const std::string& ext) {
  return "processed/" + segment(ownerId, "owner id") + "/generated/" + segment(assetId, "asset id") + "." + ext;
}

bool isOriginalPath(const std::string& path) {
  return path.rfind("original/", 0) == 0;
}

} // namespace wam
