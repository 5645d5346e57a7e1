#include "HttpServer.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <functional>
#include <string>

#include "ResponseJson.hpp"
#include "core/errors/ServiceError.hpp"
#include "services/auth/Authenticator.hpp"
#include "services/pipeline/Orchestrator.hpp"

using nlohmann::json;

// -------- helpers --------

namespace {

void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

void send_error(httplib::Response& res, const wam::ServiceError& e) {
  send_json(res, e.httpStatus(), wam::error_to_json(e.code(), e.what()));
}

// Runs a handler body, mapping exceptions onto the error response.
void guarded(const httplib::Request& req, httplib::Response& res, const std::function<void()>& body) {
  try {
    body();
  } catch (const wam::ServiceError& e) {
    if (e.httpStatus() >= 500) {
      spdlog::error("{} {} -> {} {}: {}", req.method, req.path, e.httpStatus(), wam::to_string(e.code()), e.what());
    } else {
      spdlog::warn("{} {} -> {} {}: {}", req.method, req.path, e.httpStatus(), wam::to_string(e.code()), e.what());
    }
    send_error(res, e);
  } catch (const std::exception& e) {
    spdlog::error("{} {} -> 500: {}", req.method, req.path, e.what());
    send_json(res, 500, wam::error_to_json(wam::ErrorCode::InternalError, e.what()));
  }
}

std::string form_value(const httplib::Request& req, const char* k, const std::string& def = {}) {
  if (req.has_file(k)) return req.get_file_value(k).content;
  if (req.has_param(k)) return req.get_param_value(k);
  return def;
}

} // namespace

// -------- handlers --------

namespace wam {

ApiHandlers::ApiHandlers(Orchestrator& pipeline, Authenticator& auth)
  : pipeline_(pipeline), auth_(auth) {}

std::string ApiHandlers::authenticate(const httplib::Request& req) {
  const std::string header = req.get_header_value("Authorization");
  if (header.empty()) throw AuthError("Authorization header required");
  const std::string token = bearer_token(header);
  auto caller = auth_.authenticate(token);
  if (!caller) throw AuthError("Invalid authentication");
  return caller->userId;
}

void ApiHandlers::health(const httplib::Request&, httplib::Response& res) {
  res.status = 200;
  res.set_content("ok", "text/plain");
}

void ApiHandlers::processImage(const httplib::Request& req, httplib::Response& res) {
  guarded(req, res, [&] {
    UploadRequest up;
    up.ownerId = authenticate(req);

    if (!req.is_multipart_form_data() || !req.has_file("image")) {
      throw ValidationError("No image file provided");
    }
    const auto image = req.get_file_value("image");
    up.imageBytes = image.content;
    up.declaredMimeType = image.content_type;
    up.removeBackground = form_value(req, "removeBackground") != "false";
    up.assetId = form_value(req, "itemId");

    const PipelineResult r = pipeline_.processUpload(up);
    spdlog::info("process-image owner={} item={} bg={} in {} ms",
                 up.ownerId, up.assetId.empty() ? "-" : up.assetId, r.backgroundRemovalStatus, r.processingTimeMs);
    send_json(res, 200, result_to_json(r));
  });
}

void ApiHandlers::generateItemImage(const httplib::Request& req, httplib::Response& res) {
  guarded(req, res, [&] {
    GenerateRequest gen;
    gen.callerId = authenticate(req);

    json j = json::parse(req.body, nullptr, false);
    if (!j.is_object()) throw ValidationError("Request body must be a JSON object");
    auto get_s = [&](const char* k) {
      if (j.contains(k) && j[k].is_string()) return j[k].get<std::string>();
      return std::string();
    };
    gen.assetId = get_s("wardrobe_item_id");
    gen.ownerId = get_s("user_id");
    gen.prompt = get_s("prompt");

    const PipelineResult r = pipeline_.generateFromPrompt(gen);
    send_json(res, 200, result_to_json(r));
  });
}

void ApiHandlers::methodNotAllowed(const httplib::Request& req, httplib::Response& res) {
  res.set_header("Allow", "POST");
  send_json(res, 405, error_to_json(ErrorCode::MethodNotAllowed, "Method " + req.method + " not allowed"));
}

void ApiHandlers::registerRoutes(httplib::Server& svr) {
  using namespace std::placeholders;

  svr.Get("/health", std::bind(&ApiHandlers::health, this, _1, _2));

  svr.Post("/process-image", std::bind(&ApiHandlers::processImage, this, _1, _2));
  svr.Post("/generate-wardrobe-item-image", std::bind(&ApiHandlers::generateItemImage, this, _1, _2));

  for (const char* path : {"/process-image", "/generate-wardrobe-item-image"}) {
    svr.Get(path, std::bind(&ApiHandlers::methodNotAllowed, this, _1, _2));
    svr.Put(path, std::bind(&ApiHandlers::methodNotAllowed, this, _1, _2));
    svr.Patch(path, std::bind(&ApiHandlers::methodNotAllowed, this, _1, _2));
    svr.Delete(path, std::bind(&ApiHandlers::methodNotAllowed, this, _1, _2));
  }
}

// -------- server --------

void run_http_server(ApiHandlers& api, int port,
                     const std::string& mountPath, const std::string& mountDir) {
  httplib::Server svr;
  api.registerRoutes(svr);

  if (!mountDir.empty()) {
    if (!svr.set_mount_point(mountPath, mountDir)) {
      spdlog::warn("bucket directory {} not mounted at {} (missing directory)", mountDir, mountPath);
    }
  }

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404 && res.body.empty()) {
      res.set_content(error_to_json(ErrorCode::NotFound, "not found").dump(), "application/json");
    }
  });

  spdlog::info("HTTP server listening on http://0.0.0.0:{}", port);
  if (!svr.listen("0.0.0.0", port)) {
    spdlog::error("Failed to bind port {}", port);
  }
}

} // namespace wam
