#include "GenerationClient.hpp"

#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"

using nlohmann::json;

namespace wam {

GenerationSettings GenerationSettings::from_config(const Config& c) {
  GenerationSettings s;
  s.baseUrl = c.replicateBaseUrl;
  s.apiToken = c.replicateToken;
  s.pinnedVersion = c.generationVersion;
  s.models = c.generationModels;
  return s;
}

GenerationClient::GenerationClient(HttpTransport& http, GenerationSettings settings, Timing timing)
  : http_(http), settings_(std::move(settings)), timing_(std::move(timing)) {}

std::vector<GenerationClient::Candidate> GenerationClient::candidates(const std::string& prompt) const {
  const json input = {{"prompt", prompt}, {"aspect_ratio", "1:1"}};

  std::vector<Candidate> out;
  if (!settings_.pinnedVersion.empty()) {
    out.push_back({"version " + settings_.pinnedVersion,
                   settings_.baseUrl + "/v1/predictions",
                   json({{"version", settings_.pinnedVersion}, {"input", input}}).dump()});
  }
  for (const auto& model : settings_.models) {
    ModelRef ref;
    try {
      ref = parse_model_ref(model);
    } catch (const std::invalid_argument& e) {
      spdlog::warn("skipping generation model: {}", e.what());
      continue;
    }
    out.push_back({model,
                   settings_.baseUrl + "/v1/models/" + ref.owner + "/" + ref.name + "/predictions",
                   json({{"input", input}}).dump()});
  }
  return out;
}

GeneratedImage GenerationClient::generate(const std::string& prompt) {
  if (settings_.apiToken.empty()) {
    throw UpstreamError(ErrorCode::ReplicateError, "REPLICATE_API_TOKEN not configured");
  }

  const auto start = timing_.now();
  std::optional<Prediction> prediction;
  int lastStatus = 0;
  std::string lastError = "no generation model configured";

  for (const auto& c : candidates(prompt)) {
    HttpRequest req;
    req.method = "POST";
    req.url = c.url;
    req.headers["Authorization"] = "Token " + settings_.apiToken;
    req.body = c.body;
    req.contentType = "application/json";
    req.timeout = settings_.submitTimeout;

    for (int attempt = 1; attempt <= settings_.attemptsPerCandidate; ++attempt) {
      const bool more = attempt < settings_.attemptsPerCandidate;

      HttpResponse res;
      try {
        res = http_.send(req);
      } catch (const TransportError& e) {
        lastStatus = 0;
        lastError = e.what();
        spdlog::warn("generation submit to {} failed (attempt {}/{}): {}",
                     c.label, attempt, settings_.attemptsPerCandidate, e.what());
        if (more) timing_.sleep(settings_.retryPause);
        continue;
      }

      if (res.ok()) {
        prediction = parse_prediction(res.body, ErrorCode::ReplicateError);
        spdlog::info("generation accepted by {} (prediction {}, status {})",
                     c.label, prediction->id, prediction->status);
        break;
      }

      lastStatus = res.status;
      lastError = res.body;

      if (res.status == 429) {
        if (more) {
          const int wait = retry_after_seconds(res);
          spdlog::warn("generation rate-limited by {} (attempt {}/{}), retrying in {}s",
                       c.label, attempt, settings_.attemptsPerCandidate, wait);
          timing_.sleep(std::chrono::seconds(wait));
        }
        continue;
      }
      if (res.status == 404 || res.status == 422) {
        spdlog::warn("generation candidate {} rejected ({}), trying next", c.label, res.status);
        break;
      }

      spdlog::warn("generation submit to {} returned {} (attempt {}/{})",
                   c.label, res.status, attempt, settings_.attemptsPerCandidate);
      if (more) timing_.sleep(settings_.retryPause);
    }

    if (prediction) break;
  }

  if (!prediction) {
    throw UpstreamError(ErrorCode::ReplicateError,
                        "Replicate API error (" + std::to_string(lastStatus) + "): " + lastError,
                        lastStatus);
  }

  if (!is_terminal(prediction->status) && !prediction->pollUrl.empty()) {
    *prediction = pollUntilTerminal(prediction->pollUrl, timing_.now() + settings_.pollCeiling);
  }

  GeneratedImage out;
  out.imageUrl = output_or_throw(*prediction, ErrorCode::ReplicateError, "generation");
  out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(timing_.now() - start);
  spdlog::info("generation {} finished in {}ms", prediction->id, out.duration.count());
  return out;
}

Prediction GenerationClient::pollUntilTerminal(const std::string& pollUrl, Timing::Clock::time_point deadline) {
  HttpRequest req;
  req.method = "GET";
  req.url = pollUrl;
  req.headers["Authorization"] = "Token " + settings_.apiToken;
  req.timeout = settings_.pollRequestTimeout;

  while (true) {
    HttpResponse res;
    try {
      res = http_.send(req);
    } catch (const TransportError& e) {
      throw UpstreamError(ErrorCode::ReplicateError, std::string("Replicate poll error: ") + e.what());
    }
    if (!res.ok()) {
      throw UpstreamError(ErrorCode::ReplicateError,
                          "Replicate poll error (" + std::to_string(res.status) + "): " + res.body,
                          res.status);
    }

    Prediction p = parse_prediction(res.body, ErrorCode::ReplicateError);
    if (is_terminal(p.status)) return p;

    if (timing_.now() >= deadline) {
      throw UpstreamError(ErrorCode::ReplicateError,
                          "Replicate polling timed out after " +
                          std::to_string(settings_.pollCeiling.count()) + "s");
    }
    spdlog::debug("prediction {} still {}", p.id, p.status);
    timing_.sleep(settings_.pollInterval);
  }
}

} // namespace wam
