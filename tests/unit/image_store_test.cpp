#include <cassert>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>

#include "internal/storage/image/arrow_image_store.hpp"
#include "internal/storage/image/memory_image_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using artscan::storage::ImageKeyFromUrl;

const artscan::util::ImageFormat kPng{"png", "image/png", "png"};

void TestKeyFromUrl() {
  assert(ImageKeyFromUrl("memory://abc.png") == "abc.png");
  assert(ImageKeyFromUrl("https://cdn.example.org/scans/2024/abc.jpg") == "abc.jpg");
  assert(ImageKeyFromUrl("abc.gif") == "abc.gif");
}

void TestMemoryStoreRoundTrip() {
  artscan::storage::MemoryImageStore store;

  const auto first  = store.Put("pixels-1", kPng);
  const auto second = store.Put("pixels-1", kPng);
  assert(first != second);
  assert(first.rfind("memory://", 0) == 0);
  assert(first.size() > 4 && first.compare(first.size() - 4, 4, ".png") == 0);
  assert(store.Size() == 2);

  assert(store.Get(ImageKeyFromUrl(first)) == "pixels-1");

  bool threw = false;
  try {
    store.Get("missing.png");
  } catch (const artscan::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestArrowStoreWritesUnderRoot() {
  const auto root = std::filesystem::temp_directory_path() / ("artscan-images-" + artscan::util::ToString(artscan::util::GenerateUUID()));

  {
    artscan::storage::ArrowImageStore store(root.string(), "https://cdn.example.org/scans/");

    const auto url = store.Put(std::string("\x89PNG\r\n\x1A\nbody", 12), kPng);
    assert(url.rfind("https://cdn.example.org/scans/", 0) == 0);
    assert(url.find("//", 8) == std::string::npos);

    const auto key = ImageKeyFromUrl(url);
    assert(std::filesystem::exists(root / key));
    assert(!std::filesystem::exists(root / (key + ".tmp")));
    assert(store.Get(key) == std::string("\x89PNG\r\n\x1A\nbody", 12));
  }

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestKeyFromUrl();
  TestMemoryStoreRoundTrip();
  TestArrowStoreWritesUnderRoot();

  std::cout << "artscan_unit_image_store: pass\n";
  return 0;
}
