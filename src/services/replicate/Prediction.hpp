#pragma once
#include <optional>
#include <string>

#include "core/errors/ServiceError.hpp"
#include "services/http/HttpTransport.hpp"

namespace wam {

// The fields of a Replicate prediction the pipeline cares about.
struct Prediction {
  std::string id;
  std::string status;                // starting | processing | succeeded | failed | canceled
  std::optional<std::string> output; // scalar output or first element of an array
  std::string error;
  std::string pollUrl;               // urls.get
};

bool is_terminal(const std::string& status);

// Throws UpstreamError(code) when the body is not a prediction object.
Prediction parse_prediction(const std::string& body, ErrorCode code);

// Output URL of a terminal prediction, or UpstreamError(code) describing why
// there is none. `what` prefixes messages ("generation", "background removal").
std::string output_or_throw(const Prediction& p, ErrorCode code, const std::string& what);

// Seconds to wait after a 429: `retry-after` header, else the body's
// `retry_after`, else 10. Fractions round up; the result is within [1, 30].
int retry_after_seconds(const HttpResponse& res);

struct ModelRef {
  std::string owner;
  std::string name;
  std::string version;  // empty when not pinned
};

// "owner/name" or "owner/name:version"; `pinnedVersion` is used when the
// slug carries none. Throws std::invalid_argument on a malformed slug.
ModelRef parse_model_ref(const std::string& slug, const std::string& pinnedVersion = "");

} // namespace wam
