#include "SupabaseStorageBackend.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/errors/ServiceError.hpp"

using nlohmann::json;

namespace {

constexpr std::chrono::seconds kBucketTimeout{20};
constexpr std::chrono::seconds kObjectTimeout{60};

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

// Storage API errors look like {"statusCode":"404","error":"...","message":"..."}.
std::string error_message(const wam::HttpResponse& res) {
  json j = json::parse(res.body, nullptr, false);
  if (j.is_object()) {
    if (j.contains("message") && j["message"].is_string()) return j["message"].get<std::string>();
    if (j.contains("error") && j["error"].is_string()) return j["error"].get<std::string>();
  }
  return res.body.empty() ? ("HTTP " + std::to_string(res.status)) : res.body;
}

bool is_already_exists(const wam::HttpResponse& res) {
  return res.status == 409 || lower(error_message(res)).find("already exists") != std::string::npos;
}

json policy_body(const wam::BucketPolicy& p) {
  json j = {
    {"public", p.isPublic},
    {"allowed_mime_types", p.allowedMimeTypes},
  };
  if (p.fileSizeLimit) j["file_size_limit"] = *p.fileSizeLimit;
  else j["file_size_limit"] = nullptr;
  return j;
}

} // namespace

namespace wam {

SupabaseStorageBackend::SupabaseStorageBackend(HttpTransport& http, std::string baseUrl, std::string serviceKey)
  : http_(http), baseUrl_(std::move(baseUrl)), serviceKey_(std::move(serviceKey)) {
  while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

HttpRequest SupabaseStorageBackend::request(const std::string& method, const std::string& target) const {
  HttpRequest req;
  req.method = method;
  req.url = baseUrl_ + "/storage/v1" + target;
  req.headers["Authorization"] = "Bearer " + serviceKey_;
  req.headers["apikey"] = serviceKey_;
  return req;
}

std::optional<BucketPolicy> SupabaseStorageBackend::getBucket(const std::string& bucket) {
  auto req = request("GET", "/bucket/" + bucket);
  req.timeout = kBucketTimeout;

  HttpResponse res;
  try {
    res = http_.send(req);
  } catch (const TransportError& e) {
    throw StorageError(std::string("get bucket: ") + e.what());
  }

  if (!res.ok()) {
    const std::string msg = error_message(res);
    if (res.status == 404 || lower(msg).find("not found") != std::string::npos) return std::nullopt;
    throw StorageError("failed to access storage bucket \"" + bucket + "\": " + msg);
  }

  json j = json::parse(res.body, nullptr, false);
  if (!j.is_object()) throw StorageError("malformed bucket response for " + bucket);

  BucketPolicy p;
  p.name = j.value("id", bucket);
  p.isPublic = j.value("public", false);
  if (j.contains("file_size_limit") && j["file_size_limit"].is_number_integer()) {
    p.fileSizeLimit = j["file_size_limit"].get<int64_t>();
  }
  if (j.contains("allowed_mime_types") && j["allowed_mime_types"].is_array()) {
    p.allowedMimeTypes = j["allowed_mime_types"].get<std::vector<std::string>>();
  }
  return p;
}

void SupabaseStorageBackend::createBucket(const BucketPolicy& policy) {
  auto req = request("POST", "/bucket");
  req.timeout = kBucketTimeout;
  json body = policy_body(policy);
  body["id"] = policy.name;
  body["name"] = policy.name;
  req.body = body.dump();
  req.contentType = "application/json";

  HttpResponse res;
  try {
    res = http_.send(req);
  } catch (const TransportError& e) {
    throw StorageError(std::string("create bucket: ") + e.what());
  }
  if (res.ok()) return;
  if (is_already_exists(res)) throw BucketAlreadyExistsError(policy.name);
  throw StorageError("failed to create storage bucket \"" + policy.name + "\": " + error_message(res));
}

void SupabaseStorageBackend::updateBucket(const BucketPolicy& policy) {
  auto req = request("PUT", "/bucket/" + policy.name);
  req.timeout = kBucketTimeout;
  req.body = policy_body(policy).dump();
  req.contentType = "application/json";

  HttpResponse res;
  try {
    res = http_.send(req);
  } catch (const TransportError& e) {
    throw StorageError(std::string("update bucket: ") + e.what());
  }
  if (!res.ok()) {
    throw StorageError("failed to update storage bucket \"" + policy.name + "\": " + error_message(res));
  }
}

void SupabaseStorageBackend::putObject(const std::string& bucket,
                                       const std::string& path,
                                       std::string_view bytes,
                                       const std::string& contentType,
                                       bool upsert) {
  auto req = request("POST", "/object/" + bucket + "/" + path);
  req.timeout = kObjectTimeout;
  req.headers["x-upsert"] = upsert ? "true" : "false";
  req.headers["cache-control"] = "max-age=3600";
  req.body.assign(bytes.data(), bytes.size());
  req.contentType = contentType;

  HttpResponse res;
  try {
    res = http_.send(req);
  } catch (const TransportError& e) {
    throw StorageError("upload " + path + ": " + e.what());
  }
  if (res.ok()) return;
  if (!upsert && is_already_exists(res)) throw ObjectExistsError(path);
  throw StorageError("failed to upload " + path + ": " + error_message(res));
}

void SupabaseStorageBackend::removeObjects(const std::string& bucket,
                                           const std::vector<std::string>& paths) {
  if (paths.empty()) return;
  auto req = request("DELETE", "/object/" + bucket);
  req.timeout = kObjectTimeout;
  req.body = json({{"prefixes", paths}}).dump();
  req.contentType = "application/json";

  HttpResponse res;
  try {
    res = http_.send(req);
  } catch (const TransportError& e) {
    throw StorageError(std::string("remove objects: ") + e.what());
  }
  if (!res.ok()) throw StorageError("failed to remove objects: " + error_message(res));
}

std::string SupabaseStorageBackend::publicUrl(const std::string& bucket, const std::string& path) const {
  return baseUrl_ + "/storage/v1/object/public/" + bucket + "/" + path;
}

} // namespace wam
