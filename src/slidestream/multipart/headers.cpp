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

#include "slidestream/multipart/headers.h"

#include <string>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "slidestream/core/errors.h"
#include "slidestream/status/status_macros.h"

namespace slidestream {
namespace multipart {

namespace {

/// @brief Remove one layer of surrounding double quotes
std::string_view Unquote(std::string_view value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

/// @brief Look up a `key=value` parameter after the leading token
///
/// `form-data; name="file"; filename="a.bin"` has parameters name and
/// filename; the first segment (the disposition type or media type) is
/// never treated as a parameter.
std::optional<std::string> FindParameter(std::string_view field,
                                         std::string_view key) {
  std::vector<std::string_view> segments = absl::StrSplit(field, ';');
  for (size_t i = 1; i < segments.size(); ++i) {
    const std::string_view param = absl::StripAsciiWhitespace(segments[i]);
    const size_t eq = param.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    const std::string_view name =
        absl::StripAsciiWhitespace(param.substr(0, eq));
    if (!absl::EqualsIgnoreCase(name, key)) {
      continue;
    }
    return std::string(
        Unquote(absl::StripAsciiWhitespace(param.substr(eq + 1))));
  }
  return std::nullopt;
}

}  // namespace

void PartHeaders::Add(std::string_view name, std::string_view value) {
  fields_.emplace(absl::AsciiStrToLower(name), std::string(value));
}

std::optional<std::string> PartHeaders::Get(std::string_view name) const {
  auto it = fields_.find(absl::AsciiStrToLower(name));
  if (it == fields_.end()) {
    return std::nullopt;
  }
  return it->second;
}

PartHeaders ParseHeaderBlock(std::string_view block) {
  PartHeaders headers;
  for (std::string_view line : absl::StrSplit(block, "\r\n")) {
    const size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    const std::string_view name =
        absl::StripAsciiWhitespace(line.substr(0, colon));
    if (name.empty()) {
      continue;
    }
    headers.Add(name, absl::StripAsciiWhitespace(line.substr(colon + 1)));
  }
  return headers;
}

std::optional<std::string> ParseDispositionFilename(
    std::string_view content_disposition) {
  return FindParameter(content_disposition, "filename");
}

bool IsMultipartContentType(std::string_view content_type) {
  return absl::StartsWithIgnoreCase(
      absl::StripLeadingAsciiWhitespace(content_type), "multipart/");
}

absl::StatusOr<std::string> ParseMultipartBoundary(
    std::string_view content_type) {
  if (!IsMultipartContentType(content_type)) {
    return MAKE_STATUS(
        core::kInvalidArgument,
        absl::StrFormat("Not a multipart content type: '%s'", content_type));
  }
  std::optional<std::string> boundary =
      FindParameter(content_type, "boundary");
  if (!boundary.has_value() || boundary->empty()) {
    return MAKE_STATUS(
        core::kFieldMissing,
        absl::StrFormat("No boundary parameter in content type '%s'",
                        content_type));
  }
  return *boundary;
}

}  // namespace multipart
}  // namespace slidestream
