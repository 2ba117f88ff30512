#pragma once

#include <arrow/filesystem/filesystem.h>

#include <memory>
#include <string>

#include "internal/storage/image_store.hpp"

namespace artscan::storage {

/*
  Image store on any Arrow filesystem.

  root is a local path or a filesystem URI (file://, s3://, gs://, ...).
  Objects are written to a temporary key and moved into place, so a
  reader never observes a partial image.
*/
class ArrowImageStore final : public ImageStore {
 public:
  ArrowImageStore(const std::string& root, std::string public_base_url);

  std::string Put(std::string_view bytes, const util::ImageFormat& format) override;
  std::string Get(const std::string& key) override;

 private:
  std::string ObjectPath(const std::string& key) const;

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;
  std::string                            public_base_url_;
};

} // namespace artscan::storage
