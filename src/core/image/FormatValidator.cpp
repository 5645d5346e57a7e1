#include "FormatValidator.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>

namespace {

bool has_prefix_at(std::string_view bytes, std::size_t offset,
                   std::initializer_list<std::uint8_t> sig) {
  if (bytes.size() < offset + sig.size()) return false;
  std::size_t i = offset;
  for (auto b : sig) {
    if (static_cast<std::uint8_t>(bytes[i++]) != b) return false;
  }
  return true;
}

bool is_jpeg(std::string_view b) { return has_prefix_at(b, 0, {0xFF, 0xD8, 0xFF}); }
bool is_png(std::string_view b)  { return has_prefix_at(b, 0, {0x89, 0x50, 0x4E, 0x47}); }
bool is_gif(std::string_view b)  { return has_prefix_at(b, 0, {0x47, 0x49, 0x46, 0x38}); }
bool is_webp(std::string_view b) {
  // "RIFF" <size:4> "WEBP"
  return has_prefix_at(b, 0, {0x52, 0x49, 0x46, 0x46}) &&
         has_prefix_at(b, 8, {0x57, 0x45, 0x42, 0x50});
}

} // namespace

namespace wam {

bool matchesDeclaredType(std::string_view bytes, std::string_view mimeType) {
  if (mimeType == "image/jpeg") return is_jpeg(bytes);
  if (mimeType == "image/png")  return is_png(bytes);
  if (mimeType == "image/webp") return is_webp(bytes);
  if (mimeType == "image/gif")  return is_gif(bytes);
  return false;
}

std::string sniffImageType(std::string_view bytes) {
  if (is_png(bytes))  return "image/png";
  if (is_jpeg(bytes)) return "image/jpeg";
  if (is_webp(bytes)) return "image/webp";
  return {};
}

bool hasAlphaChannel(std::string_view bytes) {
  if (bytes.size() < 26 || !is_png(bytes)) return false;
  const auto colorType = static_cast<std::uint8_t>(bytes[25]);
  return colorType == 4 || colorType == 6;
}

std::string extensionForMimeType(std::string_view mimeType) {
  if (mimeType == "image/png")  return "png";
  if (mimeType == "image/webp") return "webp";
  if (mimeType == "image/gif")  return "gif";
  return "jpg";
}

std::string mimeTypeForContentType(std::string_view contentType) {
  if (contentType.find("image/webp") != std::string_view::npos) return "image/webp";
  if (contentType.find("image/jpeg") != std::string_view::npos) return "image/jpeg";
  return "image/png";
}

} // namespace wam
