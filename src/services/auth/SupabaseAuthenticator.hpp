#pragma once
#include <string>

#include "Authenticator.hpp"
#include "services/http/HttpTransport.hpp"

namespace wam {

// Validates user access tokens against Supabase Auth (GET /auth/v1/user).
class SupabaseAuthenticator : public Authenticator {
public:
  SupabaseAuthenticator(HttpTransport& http, std::string supabaseUrl, std::string apiKey);

  std::optional<Caller> authenticate(const std::string& bearerToken) override;

private:
  HttpTransport& http_;
  std::string supabaseUrl_;
  std::string apiKey_;
};

} // namespace wam
