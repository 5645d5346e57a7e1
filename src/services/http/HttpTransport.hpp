#pragma once
#include <chrono>
#include <map>
#include <stdexcept>
#include <string>

namespace wam {

// Connection-level failure: DNS, connect, TLS, read/write timeout.
class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct HttpRequest {
  std::string method = "GET";
  std::string url;                              // absolute, scheme://host[:port]/path
  std::map<std::string, std::string> headers;
  std::string body;
  std::string contentType;                      // only sent with a body
  std::chrono::seconds timeout{30};
};

struct HttpResponse {
  int status = 0;
  std::string body;
  std::map<std::string, std::string> headers;  // keys lowercased

  bool ok() const { return status >= 200 && status < 300; }
  std::string header(const std::string& lowerName) const {
    auto it = headers.find(lowerName);
    return it == headers.end() ? std::string() : it->second;
  }
};

// Outbound HTTP port. Implementations throw TransportError when no response
// was received; any HTTP status (including 4xx/5xx) is a normal return.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse send(const HttpRequest& request) = 0;
};

} // namespace wam
