#pragma once
#include <mutex>
#include <string>
#include <string_view>

#include "ObjectStore.hpp"

namespace wam {

// Filesystem ObjectStore: one directory per bucket under `root`, the bucket
// policy kept in `<root>/<bucket>.bucket.json` and in-flight upserts in
// `<root>/.staging`. Public URLs are `<publicBaseUrl>/<bucket>/<path>`; the
// HTTP server mounts only the bucket directory there.
class LocalFSBackend : public ObjectStore {
public:
  LocalFSBackend(std::string root, std::string publicBaseUrl);

  std::optional<BucketPolicy> getBucket(const std::string& bucket) override;
  void createBucket(const BucketPolicy& policy) override;
  void updateBucket(const BucketPolicy& policy) override;

  void putObject(const std::string& bucket,
                 const std::string& path,
                 std::string_view bytes,
                 const std::string& contentType,
                 bool upsert) override;
  void removeObjects(const std::string& bucket,
                     const std::vector<std::string>& paths) override;

  std::string publicUrl(const std::string& bucket,
                        const std::string& path) const override;

  std::string bucketDir(const std::string& bucket) const;

private:
  std::string root_;
  std::string publicBaseUrl_;
  std::mutex mu_;  // serialises bucket-policy file and create-if-absent
};

} // namespace wam
