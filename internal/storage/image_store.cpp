#include "image_store.hpp"

namespace artscan::storage {

std::string ImageKeyFromUrl(std::string_view url) {
  const auto slash = url.find_last_of('/');
  return std::string(slash == std::string_view::npos ? url : url.substr(slash + 1));
}

} // namespace artscan::storage
