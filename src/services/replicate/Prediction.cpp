#include "Prediction.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace {

std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

} // namespace

namespace wam {

bool is_terminal(const std::string& status) {
  return status == "succeeded" || status == "failed" || status == "canceled";
}

Prediction parse_prediction(const std::string& body, ErrorCode code) {
  json j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw UpstreamError(code, "malformed prediction response: " + body.substr(0, 200));
  }

  Prediction p;
  if (j.contains("id") && j["id"].is_string()) p.id = j["id"].get<std::string>();
  if (j.contains("status") && j["status"].is_string()) p.status = j["status"].get<std::string>();
  if (j.contains("error") && j["error"].is_string()) p.error = j["error"].get<std::string>();

  if (j.contains("output")) {
    const auto& out = j["output"];
    if (out.is_string()) {
      p.output = out.get<std::string>();
    } else if (out.is_array() && !out.empty() && out[0].is_string()) {
      p.output = out[0].get<std::string>();
    }
  }
  if (p.output && p.output->empty()) p.output.reset();

  if (j.contains("urls") && j["urls"].is_object()) {
    const auto& urls = j["urls"];
    if (urls.contains("get") && urls["get"].is_string()) p.pollUrl = urls["get"].get<std::string>();
  }
  return p;
}

std::string output_or_throw(const Prediction& p, ErrorCode code, const std::string& what) {
  if (p.status == "succeeded") {
    if (!p.output) throw UpstreamError(code, what + " succeeded but output URL is null");
    return *p.output;
  }
  if (p.status == "failed" || p.status == "canceled") {
    throw UpstreamError(code, what + " " + p.status + ": " + (p.error.empty() ? "Unknown error" : p.error));
  }
  throw UpstreamError(code, "unexpected " + what + " status: " + (p.status.empty() ? "<none>" : p.status));
}

int retry_after_seconds(const HttpResponse& res) {
  constexpr double kDefault = 10;
  constexpr double kCap = 30;

  // Positive hints only; NaN, zero, negatives and the HTTP-date form fall through.
  double hint = 0;
  const std::string header = trim(res.header("retry-after"));
  if (!header.empty()) {
    char* end = nullptr;
    const double v = std::strtod(header.c_str(), &end);
    if (end != header.c_str() && *end == '\0' && v > 0) hint = v;
  }
  if (!(hint > 0)) {
    json j = json::parse(res.body, nullptr, false);
    if (j.is_object() && j.contains("retry_after") && j["retry_after"].is_number()) {
      const double v = j["retry_after"].get<double>();
      if (v > 0) hint = v;
    }
  }
  if (!(hint > 0)) hint = kDefault;
  return static_cast<int>(std::ceil(std::clamp(hint, 1.0, kCap)));
}

ModelRef parse_model_ref(const std::string& slug, const std::string& pinnedVersion) {
  ModelRef ref;
  std::string model = trim(slug);
  if (auto colon = model.find(':'); colon != std::string::npos) {
    ref.version = trim(model.substr(colon + 1));
    model = trim(model.substr(0, colon));
  }
  if (ref.version.empty()) ref.version = trim(pinnedVersion);

  const auto slash = model.find('/');
  if (slash == std::string::npos || slash == 0 || slash + 1 == model.size() ||
      model.find('/', slash + 1) != std::string::npos) {
    throw std::invalid_argument("invalid model \"" + slug + "\", expected owner/name or owner/name:version");
  }
  ref.owner = model.substr(0, slash);
  ref.name = model.substr(slash + 1);
  return ref;
}

} // namespace wam
