#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wam {

struct BucketPolicy {
  std::string name;
  bool isPublic = true;
  std::optional<int64_t> fileSizeLimit;
  std::vector<std::string> allowedMimeTypes;
};

// Object-storage collaborator. Errors are reported as StorageError (see
// core/errors/ServiceError.hpp); createBucket raises BucketAlreadyExistsError
// and a non-upsert putObject raises ObjectExistsError on collisions.
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  // std::nullopt when the bucket does not exist.
  virtual std::optional<BucketPolicy> getBucket(const std::string& bucket) = 0;
  virtual void createBucket(const BucketPolicy& policy) = 0;
  virtual void updateBucket(const BucketPolicy& policy) = 0;

  virtual void putObject(const std::string& bucket,
                         const std::string& path,
                         std::string_view bytes,
                         const std::string& contentType,
                         bool upsert) = 0;
  virtual void removeObjects(const std::string& bucket,
                             const std::vector<std::string>& paths) = 0;

  // Pure derivation, no I/O.
  virtual std::string publicUrl(const std::string& bucket,
                                const std::string& path) const = 0;
};

} // namespace wam
