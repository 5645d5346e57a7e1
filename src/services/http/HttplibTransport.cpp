#include "HttplibTransport.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

} // namespace

namespace wam {

ParsedUrl split_url(const std::string& url) {
  const auto schemeEnd = url.find("://");
  if (schemeEnd == std::string::npos) throw std::invalid_argument("not an absolute URL: " + url);
  const std::string scheme = lower(url.substr(0, schemeEnd));
  if (scheme != "http" && scheme != "https") throw std::invalid_argument("unsupported scheme: " + url);

  const auto pathStart = url.find('/', schemeEnd + 3);
  ParsedUrl out;
  if (pathStart == std::string::npos) {
    out.origin = url;
    out.target = "/";
  } else {
    out.origin = url.substr(0, pathStart);
    out.target = url.substr(pathStart);
  }
  if (out.origin.size() <= schemeEnd + 3) throw std::invalid_argument("missing host: " + url);
  return out;
}

HttpResponse HttplibTransport::send(const HttpRequest& request) {
  ParsedUrl u;
  try {
    u = split_url(request.url);
  } catch (const std::invalid_argument& e) {
    throw TransportError(e.what());
  }

  httplib::Client cli(u.origin);
  cli.set_connection_timeout(request.timeout);
  cli.set_read_timeout(request.timeout);
  cli.set_write_timeout(request.timeout);
  cli.set_follow_location(true);

  httplib::Headers headers;
  for (const auto& [k, v] : request.headers) headers.emplace(k, v);

  httplib::Result res;
  if (request.method == "GET") {
    res = cli.Get(u.target, headers);
  } else if (request.method == "POST") {
    res = cli.Post(u.target, headers, request.body, request.contentType);
  } else if (request.method == "PUT") {
    res = cli.Put(u.target, headers, request.body, request.contentType);
  } else if (request.method == "DELETE") {
    res = cli.Delete(u.target, headers, request.body, request.contentType);
  } else {
    throw TransportError("unsupported method " + request.method);
  }

  if (!res) {
    const std::string err = httplib::to_string(res.error());
    spdlog::debug("{} {} failed: {}", request.method, request.url, err);
    throw TransportError(request.method + " " + u.origin + u.target + ": " + err);
  }

  HttpResponse out;
  out.status = res->status;
  out.body = res->body;
  for (const auto& [k, v] : res->headers) out.headers[lower(k)] = v;
  return out;
}

} // namespace wam
