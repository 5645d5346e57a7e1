#include "core/image/Resizer.hpp"

#include <gtest/gtest.h>

#include <cmath>

#include "TestSupport.hpp"
#include "core/image/FormatValidator.hpp"

using namespace wam;

TEST(ResizerTest, FitWithinNeverUpscales) {
  const auto same = fitWithin({640, 480}, 1024);
  EXPECT_EQ(same.width, 640);
  EXPECT_EQ(same.height, 480);

  const auto wide = fitWithin({4000, 1000}, 1024);
  EXPECT_EQ(wide.width, 1024);
  EXPECT_EQ(wide.height, 256);

  const auto sliver = fitWithin({5000, 2}, 100);
  EXPECT_EQ(sliver.width, 100);
  EXPECT_EQ(sliver.height, 1);
}

TEST(ResizerTest, ImageThatFitsIsReturnedUnchanged) {
  const std::string png = test::make_png(64, 32, true);
  EXPECT_EQ(resizeToFit(png, 64), png);

  const std::string jpeg = test::make_jpeg(200, 200);
  EXPECT_EQ(resizeToFit(jpeg), jpeg);
}

TEST(ResizerTest, OversizedPngIsBoundedAndKeepsAspect) {
  const std::string png = test::make_png(300, 120, true);
  const std::string out = resizeToFit(png, 100);

  ASSERT_TRUE(matchesDeclaredType(out, "image/png"));
  EXPECT_TRUE(hasAlphaChannel(out));
  const auto dims = probeDimensions(out);
  EXPECT_EQ(dims.width, 100);
  EXPECT_EQ(dims.height, 40);
}

TEST(ResizerTest, OversizedJpegBecomesBoundedPng) {
  const std::string jpeg = test::make_jpeg(150, 400);
  const std::string out = resizeToFit(jpeg, 64);

  ASSERT_TRUE(matchesDeclaredType(out, "image/png"));
  const auto dims = probeDimensions(out);
  EXPECT_LE(dims.width, 64);
  EXPECT_LE(dims.height, 64);
  EXPECT_NEAR(static_cast<double>(dims.width) / dims.height, 150.0 / 400.0, 0.02);
}

TEST(ResizerTest, ProbeReadsJpegHeader) {
  const auto dims = probeDimensions(test::make_jpeg(37, 21));
  EXPECT_EQ(dims.width, 37);
  EXPECT_EQ(dims.height, 21);
}

TEST(ResizerTest, CorruptOrUnsupportedInputThrows) {
  EXPECT_THROW(resizeToFit("not an image", 10), ImageDecodeError);

  std::string truncated = test::make_png(300, 300, false);
  truncated.resize(40);
  EXPECT_THROW(resizeToFit(truncated, 10), ImageDecodeError);

  const std::string gif = "GIF89a\x01\x00\x01\x00\x00\x00\x00";
  EXPECT_THROW(resizeToFit(gif, 10), ImageDecodeError);
}
