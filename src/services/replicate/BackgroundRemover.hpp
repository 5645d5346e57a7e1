#pragma once
#include <string>

namespace wam {

// Background-removal port: publicly reachable image URL in, URL of the
// transparent result out. Throws on failure.
class BackgroundRemover {
public:
  virtual ~BackgroundRemover() = default;
  virtual std::string removeBackground(const std::string& imageUrl) = 0;
};

} // namespace wam
