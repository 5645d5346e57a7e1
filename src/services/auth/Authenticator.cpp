#include "Authenticator.hpp"
#include "StaticTokenAuthenticator.hpp"
#include "SupabaseAuthenticator.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/errors/ServiceError.hpp"

using nlohmann::json;

namespace wam {

std::string bearer_token(const std::string& header) {
  static const std::string kPrefix = "Bearer ";
  if (header.size() <= kPrefix.size() || header.compare(0, kPrefix.size(), kPrefix) != 0) return {};
  auto token = header.substr(kPrefix.size());
  while (!token.empty() && token.back() == ' ') token.pop_back();
  return token;
}

// -------- static tokens --------

std::optional<Caller> StaticTokenAuthenticator::authenticate(const std::string& bearerToken) {
  if (bearerToken.empty()) return std::nullopt;
  auto it = tokens_.find(bearerToken);
  if (it == tokens_.end()) return std::nullopt;
  return Caller{it->second};
}

// -------- supabase --------

SupabaseAuthenticator::SupabaseAuthenticator(HttpTransport& http, std::string supabaseUrl, std::string apiKey)
  : http_(http), supabaseUrl_(std::move(supabaseUrl)), apiKey_(std::move(apiKey)) {
  while (!supabaseUrl_.empty() && supabaseUrl_.back() == '/') supabaseUrl_.pop_back();
}

std::optional<Caller> SupabaseAuthenticator::authenticate(const std::string& bearerToken) {
  if (bearerToken.empty()) return std::nullopt;

  HttpRequest req;
  req.method = "GET";
  req.url = supabaseUrl_ + "/auth/v1/user";
  req.headers["Authorization"] = "Bearer " + bearerToken;
  req.headers["apikey"] = apiKey_;
  req.timeout = std::chrono::seconds(20);

  HttpResponse res;
  try {
    res = http_.send(req);
  } catch (const TransportError& e) {
    throw ServiceError(ErrorCode::InternalError, std::string("auth service unreachable: ") + e.what());
  }
  if (res.status == 401 || res.status == 403) return std::nullopt;
  if (!res.ok()) {
    throw ServiceError(ErrorCode::InternalError, "auth service error (" + std::to_string(res.status) + ")");
  }

  json j = json::parse(res.body, nullptr, false);
  if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
    spdlog::warn("auth service returned no user id");
    return std::nullopt;
  }
  return Caller{j["id"].get<std::string>()};
}

} // namespace wam
