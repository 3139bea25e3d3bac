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

#ifndef SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_CHUNK_SOURCE_H_
#define SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_CHUNK_SOURCE_H_

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "slidestream/runtime/io/file_reader.h"

namespace fs = std::filesystem;

namespace slidestream {
namespace multipart {

using Bytes = std::vector<uint8_t>;

/// @brief Pull-based, finite sequence of byte chunks
///
/// This is the seam to the transport layer: an HTTP client streaming a
/// response body, a file on disk, or a fixed list of buffers in tests.
///
/// Contract:
/// - Every returned chunk is non-empty.
/// - End of data is reported exactly once, as std::nullopt.
/// - Calling Next() again after the end was reported is an error
///   (FailedPrecondition).
class ChunkSource {
 public:
  virtual ~ChunkSource() = default;

  /// @brief Pull the next chunk
  /// @return The chunk, std::nullopt at end of data, or a transport error
  virtual absl::StatusOr<std::optional<Bytes>> Next() = 0;

  /// @brief Declared total size of the stream, when the transport knows it
  [[nodiscard]] virtual std::optional<uint64_t> GetTotalSize() const {
    return std::nullopt;
  }
};

/// @brief Chunk source over buffers already held in memory
class MemoryChunkSource : public ChunkSource {
 public:
  /// @brief Serve the given chunks in order; empty chunks are skipped
  explicit MemoryChunkSource(std::vector<Bytes> chunks);

  /// @brief Split a contiguous buffer into chunks of at most chunk_size
  static std::unique_ptr<MemoryChunkSource> FromString(std::string_view data,
                                                       size_t chunk_size);

  absl::StatusOr<std::optional<Bytes>> Next() override;

  [[nodiscard]] std::optional<uint64_t> GetTotalSize() const override {
    return total_size_;
  }

 private:
  std::vector<Bytes> chunks_;
  size_t index_ = 0;
  uint64_t total_size_ = 0;
  bool end_reported_ = false;
};

/// @brief Chunk source streaming a file in fixed-size reads
class FileChunkSource : public ChunkSource {
 public:
  /// Chunk size used when the caller does not pick one (1 MiB).
  static constexpr size_t kDefaultChunkSize = 1024 * 1024;

  /// @brief Open a file for streaming
  /// @retval absl::NotFoundError if the file cannot be opened
  /// @retval absl::InvalidArgumentError if chunk_size is 0
  static absl::StatusOr<std::unique_ptr<FileChunkSource>> Open(
      const fs::path& path, size_t chunk_size = kDefaultChunkSize);

  absl::StatusOr<std::optional<Bytes>> Next() override;

  [[nodiscard]] std::optional<uint64_t> GetTotalSize() const override {
    return total_size_;
  }

 private:
  FileChunkSource(runtime::io::FileReader reader, size_t chunk_size,
                  uint64_t total_size)
      : reader_(std::move(reader)),
        chunk_size_(chunk_size),
        total_size_(total_size) {}

  runtime::io::FileReader reader_;
  size_t chunk_size_;
  uint64_t total_size_;
  bool end_reported_ = false;
};

}  // namespace multipart
}  // namespace slidestream

#endif  // SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_CHUNK_SOURCE_H_
