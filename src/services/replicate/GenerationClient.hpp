#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "ImageGenerator.hpp"
#include "Prediction.hpp"
#include "core/util/Timing.hpp"
#include "services/http/HttpTransport.hpp"

namespace wam {

struct Config;

struct GenerationSettings {
  std::string baseUrl = "https://api.replicate.com";
  std::string apiToken;
  std::string pinnedVersion;           // tried first when set
  std::vector<std::string> models;     // owner/name fallbacks, in order
  int attemptsPerCandidate = 3;
  std::chrono::seconds submitTimeout{60};
  std::chrono::seconds pollRequestTimeout{30};
  std::chrono::seconds pollCeiling{120};
  std::chrono::milliseconds pollInterval{1500};
  std::chrono::milliseconds retryPause{1000};  // after non-429 failures

  static GenerationSettings from_config(const Config& c);
};

// Replicate text-to-image client. Candidates are tried sequentially; the
// first accepted submission is polled to a terminal state.
class GenerationClient : public ImageGenerator {
public:
  GenerationClient(HttpTransport& http, GenerationSettings settings, Timing timing = {});

  GeneratedImage generate(const std::string& prompt) override;

private:
  struct Candidate {
    std::string label;
    std::string url;
    std::string body;
  };

  std::vector<Candidate> candidates(const std::string& prompt) const;
  Prediction pollUntilTerminal(const std::string& pollUrl, Timing::Clock::time_point deadline);

  HttpTransport& http_;
  GenerationSettings settings_;
  Timing timing_;
};

} // namespace wam
