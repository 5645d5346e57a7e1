#pragma once
#include <chrono>
#include <string>

namespace wam {

struct GeneratedImage {
  std::string imageUrl;                 // where the generated bytes can be fetched
  std::chrono::milliseconds duration{0};
};

// Text-to-image port. Throws UpstreamError(ReplicateError) on failure.
class ImageGenerator {
public:
  virtual ~ImageGenerator() = default;
  virtual GeneratedImage generate(const std::string& prompt) = 0;
};

} // namespace wam
