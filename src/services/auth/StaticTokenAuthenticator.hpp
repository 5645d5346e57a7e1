#pragma once
#include <map>
#include <string>

#include "Authenticator.hpp"

namespace wam {

// Fixed token -> user id table, for local deployments and tests.
class StaticTokenAuthenticator : public Authenticator {
public:
  explicit StaticTokenAuthenticator(std::map<std::string, std::string> tokens)
    : tokens_(std::move(tokens)) {}

  std::optional<Caller> authenticate(const std::string& bearerToken) override;

private:
  std::map<std::string, std::string> tokens_;
};

} // namespace wam
