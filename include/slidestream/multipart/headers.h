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

#ifndef SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_HEADERS_H_
#define SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_HEADERS_H_

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"

/**
 * @file headers.h
 * @brief MIME header helpers for multipart responses
 *
 * Covers the small subset of RFC 2045/2046/2183 needed to drive the
 * multipart decoder: the outer Content-Type (is it multipart, what is the
 * boundary) and the per-part header block (Content-Disposition filename).
 */

namespace slidestream {
namespace multipart {

/// @brief Header fields of one part, looked up case-insensitively
///
/// When a field repeats, the first occurrence is kept.
class PartHeaders {
 public:
  /// @brief Add a field; names are compared case-insensitively
  void Add(std::string_view name, std::string_view value);

  /// @brief Field value, if present
  [[nodiscard]] std::optional<std::string> Get(std::string_view name) const;

  [[nodiscard]] size_t size() const { return fields_.size(); }
  [[nodiscard]] bool empty() const { return fields_.empty(); }

 private:
  std::map<std::string, std::string> fields_;  ///< Keyed by lowercase name
};

/// @brief Parse a CRLF separated header block ("Name: value" per line)
///
/// Lines without a colon are ignored.
PartHeaders ParseHeaderBlock(std::string_view block);

/// @brief Extract the filename parameter from a Content-Disposition value
///
/// The parameter name is matched case-insensitively and one layer of
/// double quotes is removed from the value.
/// Example: `attachment; FileName="slide.dcm"` -> `slide.dcm`.
std::optional<std::string> ParseDispositionFilename(
    std::string_view content_disposition);

/// @brief Whether a Content-Type value denotes a multipart body
bool IsMultipartContentType(std::string_view content_type);

/// @brief Extract the boundary token from a multipart Content-Type value
///
/// Example: `multipart/related; type="application/dicom"; boundary=abc`.
/// @retval kInvalidArgument if the content type is not multipart
/// @retval kFieldMissing if there is no (non-empty) boundary parameter
absl::StatusOr<std::string> ParseMultipartBoundary(
    std::string_view content_type);

}  // namespace multipart
}  // namespace slidestream

#endif  // SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_HEADERS_H_
