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


#ifndef SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_PART_WRITER_H_
#define SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_PART_WRITER_H_

#include <cstdint>
#include <filesystem>

#include "absl/status/statusor.h"
#include "slidestream/multipart/multipart_decoder.h"

namespace slidestream {
namespace multipart {

/// @brief Stream a part body into a file
///
/// The body is written to `<destination>.part` and renamed to `destination`
/// once it is complete, so `destination` never holds a partial body. On any
/// failure the temporary is removed and `destination` is left untouched.
///
/// @param body Unread body of the current part; drained by this call
/// @param destination Final file path
/// @return Number of body bytes written
absl::StatusOr<uint64_t> WritePartBody(PartBody& body,
                                       const fs::path& destination);

}  // namespace multipart
}  // namespace slidestream

#endif  // SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_PART_WRITER_H_
