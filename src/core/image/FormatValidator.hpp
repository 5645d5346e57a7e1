#pragma once
#include <string>
#include <string_view>

namespace wam {

// Byte-level sniffing of image payloads. Mismatch is an expected outcome,
// so nothing here throws.

// True when `bytes` carries the magic signature of `mimeType`.
// Supported: image/jpeg, image/png, image/webp, image/gif.
bool matchesDeclaredType(std::string_view bytes, std::string_view mimeType);

// Stored image type detected from the bytes alone: image/png, image/jpeg
// or image/webp. Empty when none matches.
std::string sniffImageType(std::string_view bytes);

// PNG only: true for IHDR color types 4 (gray+alpha) and 6 (RGBA).
bool hasAlphaChannel(std::string_view bytes);

// Storage extension for a MIME type; unknown types map to "jpg".
std::string extensionForMimeType(std::string_view mimeType);

// Normalises a Content-Type header of a downloaded image to one of
// image/png, image/jpeg or image/webp. Absent or unknown means PNG.
std::string mimeTypeForContentType(std::string_view contentType);

} // namespace wam
