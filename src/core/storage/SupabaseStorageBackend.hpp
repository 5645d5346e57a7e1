#pragma once
#include <string>

#include "ObjectStore.hpp"
#include "services/http/HttpTransport.hpp"

namespace wam {

// ObjectStore over the Supabase Storage REST API (`/storage/v1/...`),
// authenticated with the service-role key.
class SupabaseStorageBackend : public ObjectStore {
public:
  SupabaseStorageBackend(HttpTransport& http, std::string baseUrl, std::string serviceKey);

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

private:
  HttpRequest request(const std::string& method, const std::string& target) const;

  HttpTransport& http_;
  std::string baseUrl_;
  std::string serviceKey_;
};

} // namespace wam
