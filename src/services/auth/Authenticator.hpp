#pragma once
#include <optional>
#include <string>

namespace wam {

struct Caller {
  std::string userId;
};

// Resolves a bearer token to the calling user. nullopt means the token is
// not valid; collaborator failures throw.
class Authenticator {
public:
  virtual ~Authenticator() = default;
  virtual std::optional<Caller> authenticate(const std::string& bearerToken) = 0;
};

// "Bearer abc" -> "abc"; empty when the header is absent or malformed.
std::string bearer_token(const std::string& authorizationHeader);

} // namespace wam
