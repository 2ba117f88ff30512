#include "arrow_image_store.hpp"

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/uuid.hpp"

namespace artscan::storage {

using common::ThrowIfFailed;
using common::ValueOrThrow;

ArrowImageStore::ArrowImageStore(const std::string& root, std::string public_base_url) : public_base_url_(std::move(public_base_url)) {
  fs_ = ValueOrThrow(arrow::fs::FileSystemFromUriOrPath(root, &root_path_), "open root");
  ThrowIfFailed(fs_->CreateDir(root_path_, /*recursive=*/true), "create root");

  while (!public_base_url_.empty() && public_base_url_.back() == '/') {
    public_base_url_.pop_back();
  }
  if (public_base_url_.empty()) {
    public_base_url_ = root;
  }
}

std::string ArrowImageStore::ObjectPath(const std::string& key) const {
  return root_path_ + "/" + key;
}

std::string ArrowImageStore::Put(std::string_view bytes, const util::ImageFormat& format) {
  const auto key        = util::ToString(util::GenerateUUID()) + "." + format.extension;
  const auto final_path = ObjectPath(key);
  const auto tmp_path   = final_path + ".tmp";

  {
    auto out = ValueOrThrow(fs_->OpenOutputStream(tmp_path), "open");
    ThrowIfFailed(out->Write(bytes.data(), static_cast<int64_t>(bytes.size())), "write");
    ThrowIfFailed(out->Close(), "close");
  }
  // Readers never observe a partially written object.
  ThrowIfFailed(fs_->Move(tmp_path, final_path), "publish");

  return public_base_url_ + "/" + key;
}

std::string ArrowImageStore::Get(const std::string& key) {
  return common::ReadObject(ValueOrThrow(fs_->OpenInputFile(ObjectPath(key)), "open"));
}

} // namespace artscan::storage
