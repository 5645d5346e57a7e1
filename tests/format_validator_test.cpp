#include "core/image/FormatValidator.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>

#include "TestSupport.hpp"
#include "core/util/Digest.hpp"

using namespace wam;

namespace {

std::string bytes(std::initializer_list<int> b, std::size_t padTo = 32) {
  std::string out;
  for (int v : b) out.push_back(static_cast<char>(v));
  if (out.size() < padTo) out.append(padTo - out.size(), '\0');
  return out;
}

const std::map<std::string, std::string>& samples() {
  static const std::map<std::string, std::string> s = {
    {"image/jpeg", bytes({0xFF, 0xD8, 0xFF, 0xE0})},
    {"image/png",  bytes({0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A})},
    {"image/webp", bytes({'R', 'I', 'F', 'F', 0x24, 0, 0, 0, 'W', 'E', 'B', 'P'})},
    {"image/gif",  bytes({'G', 'I', 'F', '8', '9', 'a'})},
  };
  return s;
}

} // namespace

TEST(FormatValidatorTest, EachSignatureMatchesOnlyItsOwnType) {
  for (const auto& [actual, payload] : samples()) {
    for (const auto& [declared, unused] : samples()) {
      EXPECT_EQ(matchesDeclaredType(payload, declared), actual == declared)
        << "payload " << actual << " declared " << declared;
    }
  }
}

TEST(FormatValidatorTest, UnsupportedDeclaredTypeAlwaysFails) {
  for (const auto& [type, payload] : samples()) {
    EXPECT_FALSE(matchesDeclaredType(payload, "image/bmp")) << type;
    EXPECT_FALSE(matchesDeclaredType(payload, "application/octet-stream")) << type;
    EXPECT_FALSE(matchesDeclaredType(payload, "")) << type;
  }
}

TEST(FormatValidatorTest, ShortBuffersFail) {
  EXPECT_FALSE(matchesDeclaredType("", "image/jpeg"));
  EXPECT_FALSE(matchesDeclaredType(std::string("\xFF\xD8", 2), "image/jpeg"));
  EXPECT_FALSE(matchesDeclaredType(std::string("RIFF\x24\0\0\0WEB", 11), "image/webp"));
}

TEST(FormatValidatorTest, WebpNeedsBothMarkers) {
  EXPECT_FALSE(matchesDeclaredType(bytes({'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'A', 'V', 'E'}), "image/webp"));
  EXPECT_FALSE(matchesDeclaredType(bytes({'X', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P'}), "image/webp"));
}

TEST(FormatValidatorTest, AlphaChannelFromRealPngs) {
  EXPECT_TRUE(hasAlphaChannel(test::make_png(4, 4, true)));
  EXPECT_FALSE(hasAlphaChannel(test::make_png(4, 4, false)));
  EXPECT_FALSE(hasAlphaChannel(test::make_jpeg(4, 4)));
}

TEST(FormatValidatorTest, AlphaChannelColorTypes) {
  std::string png = test::make_png(2, 2, false);
  ASSERT_GE(png.size(), 26u);
  for (int colorType : {0, 2, 3, 4, 6}) {
    png[25] = static_cast<char>(colorType);
    EXPECT_EQ(hasAlphaChannel(png), colorType == 4 || colorType == 6) << colorType;
  }
  EXPECT_FALSE(hasAlphaChannel(png.substr(0, 25)));
}

TEST(FormatValidatorTest, ExtensionsAndContentTypes) {
  EXPECT_EQ(extensionForMimeType("image/png"), "png");
  EXPECT_EQ(extensionForMimeType("image/webp"), "webp");
  EXPECT_EQ(extensionForMimeType("image/jpeg"), "jpg");
  EXPECT_EQ(extensionForMimeType("application/x-unknown"), "jpg");

  EXPECT_EQ(mimeTypeForContentType("image/webp"), "image/webp");
  EXPECT_EQ(mimeTypeForContentType("image/jpeg; charset=binary"), "image/jpeg");
  EXPECT_EQ(mimeTypeForContentType(""), "image/png");
  EXPECT_EQ(mimeTypeForContentType("application/octet-stream"), "image/png");
}

TEST(FormatValidatorTest, SniffedTypeIgnoresAnyHeaderClaim) {
  EXPECT_EQ(sniffImageType(samples().at("image/png")), "image/png");
  EXPECT_EQ(sniffImageType(samples().at("image/jpeg")), "image/jpeg");
  EXPECT_EQ(sniffImageType(samples().at("image/webp")), "image/webp");
  EXPECT_EQ(sniffImageType(samples().at("image/gif")), "");
  EXPECT_EQ(sniffImageType("<html>upstream error page</html>"), "");
  EXPECT_EQ(sniffImageType(""), "");
}

TEST(DigestTest, Sha256Hex) {
  EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
