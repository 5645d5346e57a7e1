#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace wam {

constexpr int kDefaultMaxImageDimension = 1024;

class ImageDecodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ImageDimensions {
  int width = 0;
  int height = 0;
};

// Reads width/height from a PNG or JPEG header. Throws ImageDecodeError.
ImageDimensions probeDimensions(std::string_view bytes);

// Target size for fitting (width, height) inside maxDim x maxDim.
// Never upscales; each side is rounded and at least 1px.
ImageDimensions fitWithin(ImageDimensions source, int maxDim);

// Downscales PNG/JPEG input so both sides are <= maxDim and re-encodes it as
// PNG. Input that already fits is returned as-is. Throws ImageDecodeError
// for unsupported or corrupt input; callers keep the original bytes then.
std::string resizeToFit(const std::string& bytes, int maxDim = kDefaultMaxImageDimension);

} // namespace wam
