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

#include "slidestream/runtime/io/file_reader.h"

#include "absl/strings/str_format.h"
#include "slidestream/status/status_macros.h"

namespace slidestream {
namespace runtime {
namespace io {

absl::StatusOr<FileReader> FileReader::Open(const fs::path& path,
                                            const char* mode) {
  FILE* file = fopen(path.string().c_str(), mode);
  if (!file) {
    return MAKE_STATUS(absl::StatusCode::kNotFound,
                       absl::StrFormat("Cannot open file: %s", path.string()));
  }
  return FileReader(file);
}

absl::StatusOr<int64_t> FileReader::GetSize() const {
  const int64_t current_pos = ftell(file_.get());
  if (current_pos < 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to get current file position");
  }
  if (fseek(file_.get(), 0, SEEK_END) != 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to seek to end of file");
  }
  const int64_t size = ftell(file_.get());
  if (size < 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to determine file size");
  }
  if (fseek(file_.get(), current_pos, SEEK_SET) != 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       "Failed to restore file position");
  }
  return size;
}

absl::StatusOr<size_t> FileReader::ReadSome(void* buffer, size_t size) const {
  const size_t got = fread(buffer, 1, size, file_.get());
  if (got < size && ferror(file_.get())) {
    return MAKE_STATUS(
        absl::StatusCode::kInternal,
        absl::StrFormat("Failed to read %zu bytes (got %zu)", size, got));
  }
  return got;
}

absl::Status FileReader::Write(const void* buffer, size_t size) const {
  if (fwrite(buffer, 1, size, file_.get()) != size) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       absl::StrFormat("Failed to write %zu bytes", size));
  }
  return absl::OkStatus();
}

absl::Status FileReader::Close() {
  FILE* file = file_.release();
  if (file != nullptr && fclose(file) != 0) {
    return MAKE_STATUS(absl::StatusCode::kInternal, "Failed to close file");
  }
  return absl::OkStatus();
}

}  // namespace io
}  // namespace runtime
}  // namespace slidestream
