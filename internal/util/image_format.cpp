#include "image_format.hpp"

namespace artscan::util {

namespace {

bool StartsWith(std::string_view bytes, std::string_view magic) {
  return bytes.size() >= magic.size() && bytes.compare(0, magic.size(), magic) == 0;
}

} // namespace

std::optional<ImageFormat> DetectImageFormat(std::string_view bytes) {
  using namespace std::string_view_literals;

  if (StartsWith(bytes, "\xFF\xD8\xFF"sv)) {
    return ImageFormat{"jpeg", "image/jpeg", "jpg"};
  }
  if (StartsWith(bytes, "\x89PNG\r\n\x1A\n"sv)) {
    return ImageFormat{"png", "image/png", "png"};
  }
  if (StartsWith(bytes, "GIF87a"sv) || StartsWith(bytes, "GIF89a"sv)) {
    return ImageFormat{"gif", "image/gif", "gif"};
  }
  if (bytes.size() >= 12 && StartsWith(bytes, "RIFF"sv) && bytes.substr(8, 4) == "WEBP"sv) {
    return ImageFormat{"webp", "image/webp", "webp"};
  }
  // BMP needs at least the 14 byte file header to be meaningful
  if (bytes.size() >= 14 && StartsWith(bytes, "BM"sv)) {
    return ImageFormat{"bmp", "image/bmp", "bmp"};
  }
  return std::nullopt;
}

} // namespace artscan::util
