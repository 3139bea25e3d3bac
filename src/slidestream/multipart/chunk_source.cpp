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

#include "slidestream/multipart/chunk_source.h"

#include <algorithm>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "slidestream/status/status_macros.h"

namespace slidestream {
namespace multipart {

// ============================================================================
// MemoryChunkSource
// ============================================================================

MemoryChunkSource::MemoryChunkSource(std::vector<Bytes> chunks) {
  chunks_.reserve(chunks.size());
  for (auto& chunk : chunks) {
    if (chunk.empty()) {
      continue;
    }
    total_size_ += chunk.size();
    chunks_.push_back(std::move(chunk));
  }
}

std::unique_ptr<MemoryChunkSource> MemoryChunkSource::FromString(
    std::string_view data, size_t chunk_size) {
  chunk_size = std::max<size_t>(chunk_size, 1);
  std::vector<Bytes> chunks;
  for (size_t offset = 0; offset < data.size(); offset += chunk_size) {
    const std::string_view piece = data.substr(offset, chunk_size);
    chunks.emplace_back(piece.begin(), piece.end());
  }
  return std::make_unique<MemoryChunkSource>(std::move(chunks));
}

absl::StatusOr<std::optional<Bytes>> MemoryChunkSource::Next() {
  if (index_ < chunks_.size()) {
    return std::optional<Bytes>(std::move(chunks_[index_++]));
  }
  if (end_reported_) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Chunk source pulled after end of data");
  }
  end_reported_ = true;
  return std::optional<Bytes>();
}

// ============================================================================
// FileChunkSource
// ============================================================================

absl::StatusOr<std::unique_ptr<FileChunkSource>> FileChunkSource::Open(
    const fs::path& path, size_t chunk_size) {
  if (chunk_size == 0) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Chunk size must be positive");
  }
  auto reader_or = runtime::io::FileReader::Open(path, "rb");
  if (!reader_or.ok()) {
    return status::AddTrace(reader_or.status(), __func__, __FILE__, __LINE__,
                            "Failed to open multipart body");
  }
  int64_t size = 0;
  ASSIGN_OR_RETURN(size, reader_or->GetSize());
  return std::unique_ptr<FileChunkSource>(new FileChunkSource(
      std::move(reader_or).value(), chunk_size, static_cast<uint64_t>(size)));
}

absl::StatusOr<std::optional<Bytes>> FileChunkSource::Next() {
  if (end_reported_) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Chunk source pulled after end of data");
  }
  Bytes chunk(chunk_size_);
  size_t got = 0;
  ASSIGN_OR_RETURN(got, reader_.ReadSome(chunk.data(), chunk.size()),
                   absl::StrFormat("Reading chunk of %zu bytes", chunk_size_));
  if (got == 0) {
    end_reported_ = true;
    return std::optional<Bytes>();
  }
  chunk.resize(got);
  return std::optional<Bytes>(std::move(chunk));
}

}  // namespace multipart
}  // namespace slidestream
