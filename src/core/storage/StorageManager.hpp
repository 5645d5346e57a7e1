#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "ObjectStore.hpp"

namespace wam {

struct StoredObject {
  std::string path;
  std::string publicUrl;
};

// Bucket lifecycle and object placement for pipeline assets.
class StorageManager {
public:
  StorageManager(ObjectStore& store, BucketPolicy policy);

  // Creates the bucket when absent, realigns its size ceiling when it
  // differs. A concurrent "already exists" on create counts as success.
  void ensureBucket();

  // Original paths are written exclusively (ObjectExistsError on collision);
  // processed paths overwrite in place.
  StoredObject upload(const std::string& path, std::string_view bytes, const std::string& contentType);

  std::string publicUrl(const std::string& path) const;

  // Best-effort: failures are logged, never thrown.
  void remove(const std::vector<std::string>& paths) noexcept;

  const std::string& bucket() const { return policy_.name; }

private:
  ObjectStore& store_;
  BucketPolicy policy_;
};

} // namespace wam
