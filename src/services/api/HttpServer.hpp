#pragma once
#include <string>

#include <httplib.h>

namespace wam {

class Orchestrator;
class Authenticator;

// Route handlers for the pipeline endpoints. Every failure becomes the JSON
// error shape with the status carried by its ServiceError.
class ApiHandlers {
public:
  ApiHandlers(Orchestrator& pipeline, Authenticator& auth);

  void health(const httplib::Request& req, httplib::Response& res);

  // multipart/form-data: image (file), removeBackground, itemId
  void processImage(const httplib::Request& req, httplib::Response& res);

  // JSON: {wardrobe_item_id, user_id, prompt}
  void generateItemImage(const httplib::Request& req, httplib::Response& res);

  void methodNotAllowed(const httplib::Request& req, httplib::Response& res);

  void registerRoutes(httplib::Server& svr);

private:
  // Resolves the bearer token to a user id; throws AuthError.
  std::string authenticate(const httplib::Request& req);

  Orchestrator& pipeline_;
  Authenticator& auth_;
};

// Start a blocking HTTP server. When `mountDir` is non-empty, its files are
// served under `mountPath` (local storage backend, one bucket directory).
void run_http_server(ApiHandlers& api, int port,
                     const std::string& mountPath, const std::string& mountDir);

} // namespace wam
