#include "LocalFSBackend.hpp"
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <thread>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/errors/ServiceError.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

fs::path policy_file(const std::string& root, const std::string& bucket) {
  return fs::path(root) / (bucket + ".bucket.json");
}

// Rejects absolute paths and any ".." segment so objects stay in the bucket.
fs::path object_file(const std::string& root, const std::string& bucket, const std::string& path) {
  const fs::path rel(path);
  if (path.empty() || rel.is_absolute()) throw wam::StorageError("invalid object path: " + path);
  for (const auto& part : rel) {
    if (part == "..") throw wam::StorageError("invalid object path: " + path);
  }
  return fs::path(root) / bucket / rel;
}

// Per-write staging name under <root>/.staging, outside every bucket and on
// the same filesystem so the final rename stays atomic.
fs::path staging_file(const std::string& root) {
  static std::atomic<unsigned long long> seq{0};
  const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
  return fs::path(root) / ".staging" /
         (std::to_string(tid) + "-" + std::to_string(seq.fetch_add(1)) + ".part");
}

void write_policy(const fs::path& file, const wam::BucketPolicy& p) {
  json j = {
    {"name", p.name},
    {"public", p.isPublic},
    {"allowed_mime_types", p.allowedMimeTypes},
  };
  if (p.fileSizeLimit) j["file_size_limit"] = *p.fileSizeLimit;
  else j["file_size_limit"] = nullptr;

  std::ofstream os(file, std::ios::trunc);
  os << j.dump(2);
  os.flush();
  if (!os) throw wam::StorageError("failed to write bucket policy " + file.string());
}

} // namespace

namespace wam {

LocalFSBackend::LocalFSBackend(std::string root, std::string publicBaseUrl)
  : root_(std::move(root)), publicBaseUrl_(std::move(publicBaseUrl)) {
  while (!publicBaseUrl_.empty() && publicBaseUrl_.back() == '/') publicBaseUrl_.pop_back();
}

std::optional<BucketPolicy> LocalFSBackend::getBucket(const std::string& bucket) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto file = policy_file(root_, bucket);
  if (!fs::exists(file)) return std::nullopt;

  std::ifstream in(file);
  json j = json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw StorageError("corrupt bucket policy " + file.string());
  }
  BucketPolicy p;
  p.name = j.value("name", bucket);
  p.isPublic = j.value("public", true);
  if (j.contains("file_size_limit") && j["file_size_limit"].is_number_integer()) {
    p.fileSizeLimit = j["file_size_limit"].get<int64_t>();
  }
  if (j.contains("allowed_mime_types") && j["allowed_mime_types"].is_array()) {
    p.allowedMimeTypes = j["allowed_mime_types"].get<std::vector<std::string>>();
  }
  return p;
}

void LocalFSBackend::createBucket(const BucketPolicy& policy) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto file = policy_file(root_, policy.name);
  if (fs::exists(file)) throw BucketAlreadyExistsError(policy.name);
  std::error_code ec;
  fs::create_directories(fs::path(root_) / policy.name, ec);
  if (ec) throw StorageError("create bucket " + policy.name + ": " + ec.message());
  write_policy(file, policy);
}

void LocalFSBackend::updateBucket(const BucketPolicy& policy) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto file = policy_file(root_, policy.name);
  if (!fs::exists(file)) throw StorageError("bucket not found: " + policy.name);
  write_policy(file, policy);
}

void LocalFSBackend::putObject(const std::string& bucket,
                               const std::string& path,
                               std::string_view bytes,
                               const std::string& contentType,
                               bool upsert) {
  const fs::path file = object_file(root_, bucket, path);
  if (!fs::exists(fs::path(root_) / bucket)) throw StorageError("bucket not found: " + bucket);

  // Policy checks mirror what a hosted bucket enforces on upload.
  if (auto policy = getBucket(bucket)) {
    if (policy->fileSizeLimit && static_cast<int64_t>(bytes.size()) > *policy->fileSizeLimit) {
      throw StorageError("object exceeds bucket size limit: " + path);
    }
    if (!policy->allowedMimeTypes.empty()) {
      bool allowed = false;
      for (const auto& t : policy->allowedMimeTypes) allowed = allowed || t == contentType;
      if (!allowed) throw StorageError("content type not allowed in bucket: " + contentType);
    }
  }

  std::error_code ec;
  fs::create_directories(file.parent_path(), ec);
  if (ec) throw StorageError("mkdir " + file.parent_path().string() + ": " + ec.message());

  if (!upsert) {
    // Exclusive create: fails when the object already exists.
    std::FILE* fp = std::fopen(file.string().c_str(), "wbx");
    if (!fp) {
      if (fs::exists(file)) throw ObjectExistsError(path);
      throw StorageError("open " + file.string() + " failed");
    }
    const bool ok = std::fwrite(bytes.data(), 1, bytes.size(), fp) == bytes.size();
    const bool closed = std::fclose(fp) == 0;
    if (!ok || !closed) throw StorageError("write " + file.string() + " failed");
    return;
  }

  // Upsert stages a private copy and renames it over the target; the last
  // rename wins when writers race on one path.
  const fs::path tmp = staging_file(root_);
  fs::create_directories(tmp.parent_path(), ec);
  if (ec) throw StorageError("mkdir " + tmp.parent_path().string() + ": " + ec.message());
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      os.close();
      fs::remove(tmp, ec);
      throw StorageError("write " + tmp.string() + " failed");
    }
  }
  fs::rename(tmp, file, ec);
  if (ec) {
    const std::string reason = ec.message();
    fs::remove(tmp, ec);
    throw StorageError("rename to " + file.string() + ": " + reason);
  }
}

void LocalFSBackend::removeObjects(const std::string& bucket,
                                   const std::vector<std::string>& paths) {
  std::string failures;
  for (const auto& path : paths) {
    std::error_code ec;
    fs::remove(object_file(root_, bucket, path), ec);
    if (ec) failures += (failures.empty() ? "" : ", ") + path + " (" + ec.message() + ")";
  }
  if (!failures.empty()) throw StorageError("remove failed: " + failures);
}

std::string LocalFSBackend::bucketDir(const std::string& bucket) const {
  return (fs::path(root_) / bucket).string();
}

std::string LocalFSBackend::publicUrl(const std::string& bucket, const std::string& path) const {
  return publicBaseUrl_ + "/" + bucket + "/" + path;
}

} // namespace wam
