#pragma once
#include <string>

#include "HttpTransport.hpp"

namespace wam {

struct ParsedUrl {
  std::string origin;  // scheme://host[:port]
  std::string target;  // /path?query, "/" when empty
};

// Splits an absolute http(s) URL. Throws std::invalid_argument otherwise.
ParsedUrl split_url(const std::string& url);

// cpp-httplib backed transport. A new client is built for every request so
// nothing is shared between pipeline invocations.
class HttplibTransport : public HttpTransport {
public:
  HttpResponse send(const HttpRequest& request) override;
};

} // namespace wam
