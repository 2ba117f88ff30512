#pragma once

#include <arrow/buffer.h>
#include <arrow/io/interfaces.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace artscan::storage::common {

// Arrow reports filesystem failures through Status; the image store
// surfaces them as runtime_error tagged with the operation.
inline void ThrowIfFailed(const arrow::Status& status, const char* operation) {
  if (!status.ok()) {
    throw std::runtime_error(std::string("image store ") + operation + ": " + status.ToString());
  }
}

template <typename T>
T ValueOrThrow(arrow::Result<T>&& result, const char* operation) {
  ThrowIfFailed(result.status(), operation);
  return std::move(result).ValueUnsafe();
}

inline std::string ReadObject(const std::shared_ptr<arrow::io::RandomAccessFile>& file) {
  const auto size = ValueOrThrow(file->GetSize(), "size");
  return ValueOrThrow(file->Read(size), "read")->ToString();
}

} // namespace artscan::storage::common
