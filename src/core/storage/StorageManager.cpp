#include "StorageManager.hpp"

#include <spdlog/spdlog.h>

#include "StoragePaths.hpp"
#include "core/errors/ServiceError.hpp"

namespace wam {

StorageManager::StorageManager(ObjectStore& store, BucketPolicy policy)
  : store_(store), policy_(std::move(policy)) {}

void StorageManager::ensureBucket() {
  if (auto existing = store_.getBucket(policy_.name)) {
    if (existing->fileSizeLimit != policy_.fileSizeLimit) {
      spdlog::info("bucket {}: updating size limit {} -> {}", policy_.name,
                   existing->fileSizeLimit ? std::to_string(*existing->fileSizeLimit) : "none",
                   policy_.fileSizeLimit ? std::to_string(*policy_.fileSizeLimit) : "none");
      store_.updateBucket(policy_);
    }
    return;
  }

  try {
    store_.createBucket(policy_);
    spdlog::info("bucket {} created", policy_.name);
  } catch (const BucketAlreadyExistsError&) {
    spdlog::debug("bucket {} created concurrently", policy_.name);
  }
}

StoredObject StorageManager::upload(const std::string& path, std::string_view bytes, const std::string& contentType) {
  const bool upsert = !isOriginalPath(path);
  store_.putObject(policy_.name, path, bytes, contentType, upsert);
  spdlog::debug("stored {} ({} bytes, {}, upsert={})", path, bytes.size(), contentType, upsert);
  return {path, store_.publicUrl(policy_.name, path)};
}

std::string StorageManager::publicUrl(const std::string& path) const {
  return store_.publicUrl(policy_.name, path);
}

void StorageManager::remove(const std::vector<std::string>& paths) noexcept {
  if (paths.empty()) return;
  try {
    store_.removeObjects(policy_.name, paths);
  } catch (const std::exception& e) {
    spdlog::warn("cleanup of {} object(s) in {} failed: {}", paths.size(), policy_.name, e.what());
  }
}

} // namespace wam
