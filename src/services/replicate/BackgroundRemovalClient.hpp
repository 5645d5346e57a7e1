#pragma once
#include <chrono>
#include <string>

#include "BackgroundRemover.hpp"
#include "core/util/Timing.hpp"
#include "services/http/HttpTransport.hpp"

namespace wam {

struct Config;

struct BackgroundRemovalSettings {
  std::string baseUrl = "https://api.replicate.com";
  std::string apiToken;
  std::string model = "851-labs/background-remover";  // owner/name[:version]
  std::string pinnedVersion;
  std::chrono::seconds registryTimeout{20};
  std::chrono::seconds submitTimeout{60};

  static BackgroundRemovalSettings from_config(const Config& c);
};

// One blocking ("Prefer: wait") Replicate prediction per call. The model
// version is resolved on every call when not pinned.
class BackgroundRemovalClient : public BackgroundRemover {
public:
  BackgroundRemovalClient(HttpTransport& http, BackgroundRemovalSettings settings);

  std::string removeBackground(const std::string& imageUrl) override;

  // Latest version id of the configured model, or the pinned one.
  std::string resolveVersion();

private:
  HttpTransport& http_;
  BackgroundRemovalSettings settings_;
};

// Retries the whole removal up to `maxAttempts` times, sleeping
// attempt x `step` between attempts; the last error propagates.
class RetryingBackgroundRemover : public BackgroundRemover {
public:
  RetryingBackgroundRemover(BackgroundRemover& inner, int maxAttempts, Timing timing = {},
                            std::chrono::milliseconds step = std::chrono::seconds(1));

  std::string removeBackground(const std::string& imageUrl) override;

private:
  BackgroundRemover& inner_;
  int maxAttempts_;
  Timing timing_;
  std::chrono::milliseconds step_;
};

} // namespace wam
