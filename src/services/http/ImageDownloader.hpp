#pragma once
#include <chrono>
#include <string>

#include "HttpTransport.hpp"

namespace wam {

struct DownloadedImage {
  std::string bytes;
  std::string contentType;  // raw Content-Type header, may be empty
};

// Fetches result images produced by the model services.
class ImageDownloader {
public:
  explicit ImageDownloader(HttpTransport& http, std::chrono::seconds timeout = std::chrono::seconds(30))
    : http_(http), timeout_(timeout) {}

  // Throws TransportError on connection failures and non-2xx responses.
  DownloadedImage fetch(const std::string& url);

private:
  HttpTransport& http_;
  std::chrono::seconds timeout_;
};

} // namespace wam
