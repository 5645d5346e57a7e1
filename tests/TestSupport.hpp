#pragma once
#include <chrono>
#include <cstdlib>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <jpeglib.h>
#include <png.h>

#include "core/util/Timing.hpp"
#include "services/http/HttpTransport.hpp"

namespace wam::test {

// Replays queued responses (or a custom handler) and records every request.
class FakeTransport : public HttpTransport {
public:
  using Handler = std::function<HttpResponse(const HttpRequest&)>;

  HttpResponse send(const HttpRequest& request) override {
    requests.push_back(request);
    if (handler) return handler(request);
    if (queue.empty()) throw std::logic_error("unexpected request: " + request.method + " " + request.url);
    auto next = queue.front();
    queue.pop_front();
    return next();
  }

  void reply(int status, std::string body, std::map<std::string, std::string> headers = {}) {
    queue.push_back([=] {
      HttpResponse r;
      r.status = status;
      r.body = body;
      r.headers = headers;
      return r;
    });
  }

  void fail(const std::string& what) {
    queue.push_back([=]() -> HttpResponse { throw TransportError(what); });
  }

  std::vector<HttpRequest> requests;
  std::deque<std::function<HttpResponse()>> queue;
  Handler handler;
};

// Simulated steady clock: sleeping advances time instantly.
struct FakeClock {
  Timing::Clock::time_point now{};
  std::vector<std::chrono::milliseconds> sleeps;

  Timing timing() {
    Timing t;
    t.sleep = [this](std::chrono::milliseconds d) {
      sleeps.push_back(d);
      now += d;
    };
    t.now = [this] { return now; };
    return t;
  }
};

class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("wam-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::string str() const { return path_.string(); }

private:
  std::filesystem::path path_;
};

// -------- image fixtures --------

inline std::string make_png(int width, int height, bool alpha) {
  const int channels = alpha ? 4 : 3;
  std::vector<std::uint8_t> pixels(static_cast<std::size_t>(width) * height * channels);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      std::uint8_t* p = &pixels[(static_cast<std::size_t>(y) * width + x) * channels];
      p[0] = static_cast<std::uint8_t>(x * 255 / (width > 1 ? width - 1 : 1));
      p[1] = static_cast<std::uint8_t>(y * 255 / (height > 1 ? height - 1 : 1));
      p[2] = 128;
      if (alpha) p[3] = (x + y) % 2 ? 255 : 0;
    }
  }

  png_image image;
  std::memset(&image, 0, sizeof(image));
  image.version = PNG_IMAGE_VERSION;
  image.width = static_cast<png_uint_32>(width);
  image.height = static_cast<png_uint_32>(height);
  image.format = alpha ? PNG_FORMAT_RGBA : PNG_FORMAT_RGB;

  png_alloc_size_t size = 0;
  if (!png_image_write_to_memory(&image, nullptr, &size, 0, pixels.data(), 0, nullptr)) {
    throw std::runtime_error(image.message);
  }
  std::string out(size, '\0');
  if (!png_image_write_to_memory(&image, out.data(), &size, 0, pixels.data(), 0, nullptr)) {
    throw std::runtime_error(image.message);
  }
  out.resize(size);
  return out;
}

inline std::string make_jpeg(int width, int height) {
  jpeg_compress_struct cinfo{};
  jpeg_error_mgr jerr{};
  cinfo.err = jpeg_std_error(&jerr);
  jpeg_create_compress(&cinfo);

  unsigned char* buffer = nullptr;
  unsigned long size = 0;
  jpeg_mem_dest(&cinfo, &buffer, &size);

  cinfo.image_width = static_cast<JDIMENSION>(width);
  cinfo.image_height = static_cast<JDIMENSION>(height);
  cinfo.input_components = 3;
  cinfo.in_color_space = JCS_RGB;
  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, 90, TRUE);
  jpeg_start_compress(&cinfo, TRUE);

  std::vector<unsigned char> row(static_cast<std::size_t>(width) * 3);
  while (cinfo.next_scanline < cinfo.image_height) {
    for (int x = 0; x < width; ++x) {
      row[x * 3] = static_cast<unsigned char>(x % 256);
      row[x * 3 + 1] = static_cast<unsigned char>(cinfo.next_scanline % 256);
      row[x * 3 + 2] = 200;
    }
    JSAMPROW rowptr[1] = {row.data()};
    jpeg_write_scanlines(&cinfo, rowptr, 1);
  }
  jpeg_finish_compress(&cinfo);
  jpeg_destroy_compress(&cinfo);

  std::string out(reinterpret_cast<const char*>(buffer), size);
  std::free(buffer);
  return out;
}

inline std::string read_file(const std::filesystem::path& p) {
  std::string out;
  if (FILE* f = std::fopen(p.string().c_str(), "rb")) {
    char buf[4096];
    std::size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    std::fclose(f);
  }
  return out;
}

} // namespace wam::test
