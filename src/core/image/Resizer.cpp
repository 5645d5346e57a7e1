#include "Resizer.hpp"

#include <algorithm>
#include <cmath>
#include <csetjmp>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <vector>

#include <jpeglib.h>
#include <png.h>

#include "FormatValidator.hpp"

namespace {

struct Bitmap {
  int width = 0;
  int height = 0;
  int channels = 0;
  std::vector<std::uint8_t> pixels;
};

// -------- PNG --------

Bitmap decode_png(std::string_view input) {
  png_image image;
  std::memset(&image, 0, sizeof(image));
  image.version = PNG_IMAGE_VERSION;
  if (!png_image_begin_read_from_memory(&image, input.data(), input.size())) {
    throw wam::ImageDecodeError(std::string("PNG header: ") + image.message);
  }
  image.format = PNG_FORMAT_RGBA;

  Bitmap out;
  out.width = static_cast<int>(image.width);
  out.height = static_cast<int>(image.height);
  out.channels = 4;
  out.pixels.resize(PNG_IMAGE_SIZE(image));
  if (!png_image_finish_read(&image, nullptr, out.pixels.data(), 0, nullptr)) {
    std::string msg = image.message;
    png_image_free(&image);
    throw wam::ImageDecodeError("PNG decode: " + msg);
  }
  return out;
}

std::string encode_png(const Bitmap& bmp) {
  png_image image;
  std::memset(&image, 0, sizeof(image));
  image.version = PNG_IMAGE_VERSION;
  image.width = static_cast<png_uint_32>(bmp.width);
  image.height = static_cast<png_uint_32>(bmp.height);
  image.format = bmp.channels == 4 ? PNG_FORMAT_RGBA : PNG_FORMAT_RGB;

  // First pass sizes the buffer, second pass writes it.
  png_alloc_size_t size = 0;
  if (!png_image_write_to_memory(&image, nullptr, &size, 0, bmp.pixels.data(), 0, nullptr)) {
    throw wam::ImageDecodeError(std::string("PNG encode: ") + image.message);
  }
  std::string out(size, '\0');
  if (!png_image_write_to_memory(&image, out.data(), &size, 0, bmp.pixels.data(), 0, nullptr)) {
    throw wam::ImageDecodeError(std::string("PNG encode: ") + image.message);
  }
  out.resize(size);
  return out;
}

// -------- JPEG --------

struct JpegErrorMgr {
  jpeg_error_mgr pub;
  std::jmp_buf setjmp_buffer;
  char message[JMSG_LENGTH_MAX]{};
};

void jpeg_error_exit(j_common_ptr cinfo) {
  auto* err = reinterpret_cast<JpegErrorMgr*>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, err->message);
  std::longjmp(err->setjmp_buffer, 1);
}

// libjpeg reports errors through longjmp, so nothing with a destructor may be
// created in this frame after setjmp; `out` belongs to the caller.
bool decode_jpeg_into(std::string_view input, bool headerOnly, Bitmap& out, JpegErrorMgr& jerr) {
  jpeg_decompress_struct cinfo{};
  cinfo.err = jpeg_std_error(&jerr.pub);
  jerr.pub.error_exit = jpeg_error_exit;

  if (setjmp(jerr.setjmp_buffer)) {
    jpeg_destroy_decompress(&cinfo);
    return false;
  }

  jpeg_create_decompress(&cinfo);
  jpeg_mem_src(&cinfo, reinterpret_cast<const unsigned char*>(input.data()),
               static_cast<unsigned long>(input.size()));
  jpeg_read_header(&cinfo, TRUE);

  if (cinfo.jpeg_color_space == JCS_CMYK || cinfo.jpeg_color_space == JCS_YCCK) {
    std::snprintf(jerr.message, sizeof(jerr.message), "CMYK JPEG is not supported");
    jpeg_destroy_decompress(&cinfo);
    return false;
  }

  out.width = static_cast<int>(cinfo.image_width);
  out.height = static_cast<int>(cinfo.image_height);
  out.channels = 3;
  if (headerOnly) {
    jpeg_destroy_decompress(&cinfo);
    return true;
  }

  cinfo.out_color_space = JCS_RGB;
  jpeg_start_decompress(&cinfo);

  const std::size_t row_stride = static_cast<std::size_t>(cinfo.output_width) * 3;
  out.pixels.resize(row_stride * cinfo.output_height);
  while (cinfo.output_scanline < cinfo.output_height) {
    JSAMPROW rowptr[1];
    rowptr[0] = out.pixels.data() + static_cast<std::size_t>(cinfo.output_scanline) * row_stride;
    jpeg_read_scanlines(&cinfo, rowptr, 1);
  }

  jpeg_finish_decompress(&cinfo);
  jpeg_destroy_decompress(&cinfo);
  return true;
}

Bitmap decode_jpeg(std::string_view input, bool headerOnly) {
  Bitmap out;
  JpegErrorMgr jerr{};
  if (!decode_jpeg_into(input, headerOnly, out, jerr)) {
    throw wam::ImageDecodeError(std::string("JPEG decode: ") +
                                (jerr.message[0] != '\0' ? jerr.message : "unknown error"));
  }
  return out;
}

Bitmap decode(std::string_view input) {
  if (wam::matchesDeclaredType(input, "image/png")) return decode_png(input);
  if (wam::matchesDeclaredType(input, "image/jpeg")) return decode_jpeg(input, false);
  throw wam::ImageDecodeError("unsupported image format");
}

// -------- scaling --------

void resize_bilinear(const Bitmap& src, Bitmap& dst) {
  const int channels = src.channels;
  dst.channels = channels;
  dst.pixels.assign(static_cast<std::size_t>(dst.width) * dst.height * channels, 0);

  const float x_scale = static_cast<float>(src.width) / dst.width;
  const float y_scale = static_cast<float>(src.height) / dst.height;

  for (int y = 0; y < dst.height; ++y) {
    const float sy = (y + 0.5f) * y_scale - 0.5f;
    int y0 = static_cast<int>(std::floor(sy));
    int y1 = y0 + 1;
    const float wy = sy - y0;
    y0 = std::clamp(y0, 0, src.height - 1);
    y1 = std::clamp(y1, 0, src.height - 1);
    for (int x = 0; x < dst.width; ++x) {
      const float sx = (x + 0.5f) * x_scale - 0.5f;
      int x0 = static_cast<int>(std::floor(sx));
      int x1 = x0 + 1;
      const float wx = sx - x0;
      x0 = std::clamp(x0, 0, src.width - 1);
      x1 = std::clamp(x1, 0, src.width - 1);

      const std::uint8_t* p00 = &src.pixels[(static_cast<std::size_t>(y0) * src.width + x0) * channels];
      const std::uint8_t* p10 = &src.pixels[(static_cast<std::size_t>(y0) * src.width + x1) * channels];
      const std::uint8_t* p01 = &src.pixels[(static_cast<std::size_t>(y1) * src.width + x0) * channels];
      const std::uint8_t* p11 = &src.pixels[(static_cast<std::size_t>(y1) * src.width + x1) * channels];

      std::uint8_t* out = &dst.pixels[(static_cast<std::size_t>(y) * dst.width + x) * channels];
      for (int c = 0; c < channels; ++c) {
        const float v0 = p00[c] + (p10[c] - p00[c]) * wx;
        const float v1 = p01[c] + (p11[c] - p01[c]) * wx;
        const float v = v0 + (v1 - v0) * wy;
        out[c] = static_cast<std::uint8_t>(std::clamp(static_cast<int>(std::lround(v)), 0, 255));
      }
    }
  }
}

} // namespace

namespace wam {

ImageDimensions probeDimensions(std::string_view bytes) {
  if (matchesDeclaredType(bytes, "image/png")) {
    png_image image;
    std::memset(&image, 0, sizeof(image));
    image.version = PNG_IMAGE_VERSION;
    if (!png_image_begin_read_from_memory(&image, bytes.data(), bytes.size())) {
      throw ImageDecodeError(std::string("PNG header: ") + image.message);
    }
    ImageDimensions dims{static_cast<int>(image.width), static_cast<int>(image.height)};
    png_image_free(&image);
    return dims;
  }
  if (matchesDeclaredType(bytes, "image/jpeg")) {
    const Bitmap header = decode_jpeg(bytes, true);
    return {header.width, header.height};
  }
  throw ImageDecodeError("unsupported image format");
}

ImageDimensions fitWithin(ImageDimensions source, int maxDim) {
  if (source.width <= maxDim && source.height <= maxDim) return source;
  const double scale = std::min(static_cast<double>(maxDim) / source.width,
                                static_cast<double>(maxDim) / source.height);
  return {
    std::max(1, static_cast<int>(std::lround(source.width * scale))),
    std::max(1, static_cast<int>(std::lround(source.height * scale))),
  };
}

std::string resizeToFit(const std::string& bytes, int maxDim) {
  if (maxDim <= 0) maxDim = kDefaultMaxImageDimension;

  const ImageDimensions source = probeDimensions(bytes);
  if (source.width <= 0 || source.height <= 0) {
    throw ImageDecodeError("image has no pixels");
  }
  const ImageDimensions target = fitWithin(source, maxDim);
  if (target.width == source.width && target.height == source.height) return bytes;

  const Bitmap decoded = decode(bytes);
  Bitmap scaled;
  scaled.width = target.width;
  scaled.height = target.height;
  resize_bilinear(decoded, scaled);
  return encode_png(scaled);
}

} // namespace wam
