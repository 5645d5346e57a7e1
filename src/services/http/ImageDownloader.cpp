#include "ImageDownloader.hpp"

#include <spdlog/spdlog.h>

namespace wam {

DownloadedImage ImageDownloader::fetch(const std::string& url) {
  HttpRequest req;
  req.method = "GET";
  req.url = url;
  req.timeout = timeout_;

  HttpResponse res = http_.send(req);
  if (!res.ok()) {
    throw TransportError("failed to download image: HTTP " + std::to_string(res.status));
  }
  if (res.body.empty()) {
    throw TransportError("failed to download image: empty body");
  }
  spdlog::debug("downloaded {} bytes from {}", res.body.size(), url);
  return {std::move(res.body), res.header("content-type")};
}

} // namespace wam
