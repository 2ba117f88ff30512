#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace artscan::util {

struct ImageFormat {
  std::string name;
  std::string content_type;
  std::string extension;
};

/*
  Sniffs the container signature of an uploaded image.

  Only the magic bytes are checked; pixel data is left to the
  embedding model.
*/
std::optional<ImageFormat> DetectImageFormat(std::string_view bytes);

} // namespace artscan::util
