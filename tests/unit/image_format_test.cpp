#include "internal/util/image_format.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using artscan::util::DetectImageFormat;

std::string Bytes(const char* data, std::size_t size) {
  return std::string(data, size);
}

void TestKnownSignatures() {
  assert(DetectImageFormat(Bytes("\xFF\xD8\xFF\xE0", 4))->name == "jpeg");
  assert(DetectImageFormat(Bytes("\x89PNG\r\n\x1A\n\0\0", 10))->content_type == "image/png");
  assert(DetectImageFormat("GIF89a....")->extension == "gif");
  assert(DetectImageFormat("GIF87a....")->extension == "gif");
  assert(DetectImageFormat(Bytes("RIFF\x10\0\0\0WEBPVP8 ", 16))->name == "webp");
  assert(DetectImageFormat(Bytes("BM\x36\0\0\0\0\0\0\0\x36\0\0\0", 14))->content_type == "image/bmp");
}

void TestRejectsUnknownOrTruncated() {
  assert(!DetectImageFormat("").has_value());
  assert(!DetectImageFormat("hello, world").has_value());
  assert(!DetectImageFormat(Bytes("\xFF\xD8", 2)).has_value());
  assert(!DetectImageFormat(Bytes("\x89PNG\r\n", 6)).has_value());
  assert(!DetectImageFormat(Bytes("RIFF\x10\0\0\0WAVEfmt ", 16)).has_value());
  assert(!DetectImageFormat("BM").has_value());
}

} // namespace

int main() {
  TestKnownSignatures();
  TestRejectsUnknownOrTruncated();

  std::cout << "artscan_unit_image_format: pass\n";
  return 0;
}
