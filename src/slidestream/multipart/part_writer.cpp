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


#include "slidestream/multipart/part_writer.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "slidestream/runtime/io/file_reader.h"
#include "slidestream/status/status_macros.h"

namespace slidestream {
namespace multipart {

namespace {

absl::StatusOr<uint64_t> StreamBodyTo(PartBody& body, const fs::path& path) {
  auto writer = runtime::io::FileReader::Open(path, "wb");
  RETURN_IF_ERROR(writer.status(), "Opening part output");

  uint64_t written = 0;
  while (true) {
    std::optional<Bytes> fragment;
    ASSIGN_OR_RETURN(fragment, body.Next(), "Reading part body");
    if (!fragment.has_value()) {
      break;
    }
    RETURN_IF_ERROR(writer->Write(fragment->data(), fragment->size()),
                    "Writing part body");
    written += fragment->size();
  }
  RETURN_IF_ERROR(writer->Close(), "Closing part output");
  return written;
}

}  // namespace

absl::StatusOr<uint64_t> WritePartBody(PartBody& body,
                                       const fs::path& destination) {
  fs::path temporary = destination;
  temporary += ".part";

  absl::StatusOr<uint64_t> written = StreamBodyTo(body, temporary);
  std::error_code rename_ec;
  if (written.ok()) {
    fs::rename(temporary, destination, rename_ec);
    if (!rename_ec) {
      VLOG(1) << "Wrote " << *written << " bytes to " << destination;
      return written;
    }
  }

  std::error_code remove_ec;
  fs::remove(temporary, remove_ec);
  if (remove_ec) {
    LOG(WARNING) << "Could not remove " << temporary << ": "
                 << remove_ec.message();
  }
  if (rename_ec) {
    return MAKE_STATUS(absl::StatusCode::kInternal,
                       absl::StrFormat("Failed to rename %s: %s",
                                       temporary.string(),
                                       rename_ec.message()));
  }
  RETURN_IF_ERROR(written.status(), "Writing " + destination.string());
  return written;
}

}  // namespace multipart
}  // namespace slidestream
