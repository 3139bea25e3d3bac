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

#ifndef SLIDESTREAM_INCLUDE_SLIDESTREAM_CORE_ERRORS_H_
#define SLIDESTREAM_INCLUDE_SLIDESTREAM_CORE_ERRORS_H_

#include "absl/status/status.h"

/**
 * @file errors.h
 * @brief Error kinds reported by the pyramid and multipart components
 *
 * Every failure is an absl::Status. The kinds below are fixed aliases onto
 * absl::StatusCode so callers can branch on them without knowing which
 * code a kind was given. Statuses keep their code when trace frames are
 * appended by RETURN_IF_ERROR / ASSIGN_OR_RETURN.
 */

namespace slidestream {
namespace core {

/// Level number or tile column/row outside the grid.
inline constexpr absl::StatusCode kOutOfRange = absl::StatusCode::kOutOfRange;

/// Requested value impossible for this descriptor (e.g. magnification above
/// the slide's native one).
inline constexpr absl::StatusCode kInvalidArgument =
    absl::StatusCode::kInvalidArgument;

/// Magnification or resolution needed but not configured.
inline constexpr absl::StatusCode kCalibrationMissing =
    absl::StatusCode::kFailedPrecondition;

/// Byte stream does not follow the multipart grammar.
inline constexpr absl::StatusCode kProtocolViolation =
    absl::StatusCode::kDataLoss;

/// Required header field (the part filename) absent.
inline constexpr absl::StatusCode kFieldMissing = absl::StatusCode::kNotFound;

/// Chunk source ended in the middle of a construct. Final, never retried.
/// Shares kOutOfRange with the grid kind above; only the decoder reports it.
inline constexpr absl::StatusCode kUnexpectedEndOfStream =
    absl::StatusCode::kOutOfRange;

[[nodiscard]] inline bool IsOutOfRange(const absl::Status& status) {
  return status.code() == kOutOfRange;
}

[[nodiscard]] inline bool IsInvalidArgument(const absl::Status& status) {
  return status.code() == kInvalidArgument;
}

[[nodiscard]] inline bool IsCalibrationMissing(const absl::Status& status) {
  return status.code() == kCalibrationMissing;
}

[[nodiscard]] inline bool IsProtocolViolation(const absl::Status& status) {
  return status.code() == kProtocolViolation;
}

[[nodiscard]] inline bool IsFieldMissing(const absl::Status& status) {
  return status.code() == kFieldMissing;
}

[[nodiscard]] inline bool IsUnexpectedEndOfStream(const absl::Status& status) {
  return status.code() == kUnexpectedEndOfStream;
}

}  // namespace core
}  // namespace slidestream

#endif  // SLIDESTREAM_INCLUDE_SLIDESTREAM_CORE_ERRORS_H_
