#include "memory_image_store.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace artscan::storage {

std::string MemoryImageStore::Put(std::string_view bytes, const util::ImageFormat& format) {
  const auto key = util::ToString(util::GenerateUUID()) + "." + format.extension;

  std::lock_guard lock(mutex_);
  objects_.emplace(key, std::string(bytes));
  return "memory://" + key;
}

std::string MemoryImageStore::Get(const std::string& key) {
  std::lock_guard lock(mutex_);
  auto            it = objects_.find(key);
  if (it == objects_.end()) {
    throw util::NotFound("image " + key + " not found");
  }
  return it->second;
}

std::size_t MemoryImageStore::Size() const {
  std::lock_guard lock(mutex_);
  return objects_.size();
}

} // namespace artscan::storage
