#pragma once

#include <string>
#include <string_view>

#include "internal/util/image_format.hpp"

namespace artscan::storage {

/*
  Destination of uploaded scan and catalog images.

  Images are referenced by URL everywhere else; bytes never travel
  through the catalog store.
*/
class ImageStore {
 public:
  virtual ~ImageStore() = default;

  // Stores the bytes under a fresh <uuid>.<ext> key and returns its URL.
  virtual std::string Put(std::string_view bytes, const util::ImageFormat& format) = 0;

  // Reads an object back by the key returned inside a Put URL.
  virtual std::string Get(const std::string& key) = 0;
};

// Last path segment of an image URL.
std::string ImageKeyFromUrl(std::string_view url);

} // namespace artscan::storage
