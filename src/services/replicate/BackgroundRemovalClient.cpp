#include "BackgroundRemovalClient.hpp"

#include <exception>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "Prediction.hpp"
#include "core/config/Config.hpp"
#include "core/errors/ServiceError.hpp"

using nlohmann::json;

namespace wam {

BackgroundRemovalSettings BackgroundRemovalSettings::from_config(const Config& c) {
  BackgroundRemovalSettings s;
  s.baseUrl = c.replicateBaseUrl;
  s.apiToken = c.replicateToken;
  s.model = c.bgModel;
  s.pinnedVersion = c.modelVersion;
  return s;
}

BackgroundRemovalClient::BackgroundRemovalClient(HttpTransport& http, BackgroundRemovalSettings settings)
  : http_(http), settings_(std::move(settings)) {}

std::string BackgroundRemovalClient::resolveVersion() {
  ModelRef ref;
  try {
    ref = parse_model_ref(settings_.model, settings_.pinnedVersion);
  } catch (const std::invalid_argument& e) {
    throw UpstreamError(ErrorCode::BackgroundRemovalFailed, e.what());
  }
  if (!ref.version.empty()) return ref.version;

  HttpRequest req;
  req.method = "GET";
  req.url = settings_.baseUrl + "/v1/models/" + ref.owner + "/" + ref.name;
  req.headers["Authorization"] = "Token " + settings_.apiToken;
  req.timeout = settings_.registryTimeout;

  HttpResponse res;
  try {
    res = http_.send(req);
  } catch (const TransportError& e) {
    throw UpstreamError(ErrorCode::BackgroundRemovalFailed,
                        std::string("failed to resolve bg-removal model version: ") + e.what());
  }
  if (!res.ok()) {
    throw UpstreamError(ErrorCode::BackgroundRemovalFailed,
                        "failed to resolve bg-removal model version (" +
                        std::to_string(res.status) + "): " + res.body,
                        res.status);
  }

  json j = json::parse(res.body, nullptr, false);
  if (j.is_object() && j.contains("latest_version") && j["latest_version"].is_object()) {
    const auto& latest = j["latest_version"];
    if (latest.contains("id") && latest["id"].is_string()) return latest["id"].get<std::string>();
  }
  throw UpstreamError(ErrorCode::BackgroundRemovalFailed,
                      "no latest version found for model \"" + ref.owner + "/" + ref.name + "\"");
}

std::string BackgroundRemovalClient::removeBackground(const std::string& imageUrl) {
  if (settings_.apiToken.empty()) {
    throw UpstreamError(ErrorCode::BackgroundRemovalFailed, "REPLICATE_API_TOKEN not configured");
  }
  const std::string version = resolveVersion();

  HttpRequest req;
  req.method = "POST";
  req.url = settings_.baseUrl + "/v1/predictions";
  req.headers["Authorization"] = "Token " + settings_.apiToken;
  req.headers["Prefer"] = "wait";
  req.body = json({{"version", version}, {"input", {{"image", imageUrl}}}}).dump();
  req.contentType = "application/json";
  req.timeout = settings_.submitTimeout;

  HttpResponse res;
  try {
    res = http_.send(req);
  } catch (const TransportError& e) {
    throw UpstreamError(ErrorCode::BackgroundRemovalFailed,
                        std::string("background removal request failed: ") + e.what());
  }
  if (!res.ok()) {
    throw UpstreamError(ErrorCode::BackgroundRemovalFailed,
                        "background removal API error (" + std::to_string(res.status) + "): " + res.body,
                        res.status);
  }

  const Prediction p = parse_prediction(res.body, ErrorCode::BackgroundRemovalFailed);
  spdlog::info("background removal prediction {} -> {}", p.id, p.status);
  // Only "failed" is a service verdict here; "canceled" counts as unexpected.
  if (p.status == "canceled") {
    throw UpstreamError(ErrorCode::BackgroundRemovalFailed, "unexpected background removal status: canceled");
  }
  return output_or_throw(p, ErrorCode::BackgroundRemovalFailed, "background removal");
}

RetryingBackgroundRemover::RetryingBackgroundRemover(BackgroundRemover& inner, int maxAttempts, Timing timing,
                                                     std::chrono::milliseconds step)
  : inner_(inner), maxAttempts_(maxAttempts < 1 ? 1 : maxAttempts), timing_(std::move(timing)), step_(step) {}

std::string RetryingBackgroundRemover::removeBackground(const std::string& imageUrl) {
  std::exception_ptr last;
  for (int attempt = 1; attempt <= maxAttempts_; ++attempt) {
    try {
      return inner_.removeBackground(imageUrl);
    } catch (const std::exception& e) {
      last = std::current_exception();
      spdlog::error("background removal attempt {}/{} failed: {}", attempt, maxAttempts_, e.what());
    }
    if (attempt < maxAttempts_) timing_.sleep(step_ * attempt);
  }
  std::rethrow_exception(last);
}

} // namespace wam
