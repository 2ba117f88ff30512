#pragma once

#include <map>
#include <mutex>
#include <string>

#include "internal/storage/image_store.hpp"

namespace artscan::storage {

// Keeps images in process; URLs are memory://<uuid>.<ext>.
class MemoryImageStore final : public ImageStore {
 public:
  std::string Put(std::string_view bytes, const util::ImageFormat& format) override;
  std::string Get(const std::string& key) override;

  std::size_t Size() const;

 private:
  mutable std::mutex                 mutex_;
  std::map<std::string, std::string> objects_;
};

} // namespace artscan::storage
