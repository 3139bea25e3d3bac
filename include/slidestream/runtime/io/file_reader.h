// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SLIDESTREAM_INCLUDE_SLIDESTREAM_RUNTIME_IO_FILE_READER_H_
#define SLIDESTREAM_INCLUDE_SLIDESTREAM_RUNTIME_IO_FILE_READER_H_

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace fs = std::filesystem;

namespace slidestream {
namespace runtime {
namespace io {

/// @brief RAII wrapper for FILE* streams
///
/// Owns the handle and closes it on destruction. Used both for streaming
/// reads (chunk sources) and for writing decoded parts to disk.
///
/// Example usage:
/// ```cpp
/// auto reader = FileReader::Open(path, "rb");
/// if (!reader.ok()) return reader.status();
/// size_t got = 0;
/// ASSIGN_OR_RETURN(got, reader->ReadSome(buffer.data(), buffer.size()));
/// ```
class FileReader {
 public:
  /// @brief Open a file
  /// @param path Path to file
  /// @param mode fopen mode ("rb", "wb", ...)
  /// @retval absl::NotFoundError if the file cannot be opened
  static absl::StatusOr<FileReader> Open(const fs::path& path,
                                         const char* mode);

  FileReader(FileReader&& other) noexcept = default;
  FileReader& operator=(FileReader&& other) noexcept = default;
  ~FileReader() = default;

  FileReader(const FileReader&) = delete;
  FileReader& operator=(const FileReader&) = delete;

  /// @brief Total file size in bytes; the read position is preserved
  absl::StatusOr<int64_t> GetSize() const;

  /// @brief Read up to size bytes
  /// @return Number of bytes read, 0 only at end of file
  absl::StatusOr<size_t> ReadSome(void* buffer, size_t size) const;

  /// @brief Write exactly size bytes
  absl::Status Write(const void* buffer, size_t size) const;

  /// @brief Flush and close; errors on close are reported
  absl::Status Close();

 private:
  explicit FileReader(FILE* file) : file_(file, fclose) {}

  std::unique_ptr<FILE, decltype(&fclose)> file_;
};

}  // namespace io
}  // namespace runtime
}  // namespace slidestream

#endif  // SLIDESTREAM_INCLUDE_SLIDESTREAM_RUNTIME_IO_FILE_READER_H_
