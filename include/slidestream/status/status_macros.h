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
#ifndef SLIDESTREAM_INCLUDE_SLIDESTREAM_STATUS_STATUS_MACROS_H_
#define SLIDESTREAM_INCLUDE_SLIDESTREAM_STATUS_STATUS_MACROS_H_

#include <string>
#include <string_view>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"

namespace slidestream::status {

/**
 * @brief Formats one trace frame.
 *
 * The result looks like
 *     "  at Function (file.cpp:42) [DATA_LOSS] - optional message"
 */
inline std::string FormatFrame(const char* function, const char* file,
                               int line, absl::StatusCode code,
                               std::string_view message) {
  std::string frame = absl::StrCat("  at ", function, " (", file, ":", line,
                                   ") [", absl::StatusCodeToString(code), "]");
  if (!message.empty()) {
    absl::StrAppend(&frame, " - ", message);
  }
  return frame;
}

/**
 * @brief Appends a single frame to a non-OK status.
 *
 * OK statuses are returned unchanged. The status code is preserved, so
 * callers can keep branching on it no matter how many frames were added.
 */
inline absl::Status AddTrace(const absl::Status& st, const char* function,
                             const char* file, int line,
                             std::string_view message = {}) {
  if (st.ok()) {
    return st;
  }
  std::string out(st.message());
  out.push_back('\n');
  out += FormatFrame(function, file, line, st.code(), message);
  return absl::Status(st.code(), out);
}

/// @brief StatusOr overload of AddTrace; values pass through untouched.
template <typename T>
inline absl::StatusOr<T> AddTrace(const absl::StatusOr<T>& sor,
                                  const char* function, const char* file,
                                  int line, std::string_view message = {}) {
  if (sor.ok()) {
    return sor;
  }
  return AddTrace(sor.status(), function, file, line, message);
}

}  // namespace slidestream::status

//------------------------------------------------------------------------------
// Macros
//------------------------------------------------------------------------------

/**
 * @brief Create an absl::Status carrying its first trace frame.
 *
 * @param code    The absl::StatusCode to use.
 * @param message The error message.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define MAKE_STATUS(code, message)                                           \
  ::slidestream::status::AddTrace(absl::Status((code), (message)), __func__, \
                                  __FILE__, __LINE__)

/**
 * @brief Propagate a non-OK absl::Status, appending this function as a frame.
 *
 * @param expr  A Status-producing expression.
 * @param msg   Message for this frame (may be empty).
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define RETURN_IF_ERROR(expr, msg)                                           \
  do {                                                                       \
    auto _st = (expr);                                                       \
    if (!_st.ok()) {                                                         \
      return ::slidestream::status::AddTrace(_st, __func__, __FILE__,        \
                                             __LINE__, (msg));               \
    }                                                                        \
  } while (0)

/**
 * @brief Move the value of a StatusOr<T> into lhs, or return its traced error.
 *
 * Works for move-only values.
 *
 * @param lhs   Target variable (already declared).
 * @param expr  A StatusOr<T>-producing expression.
 * @param ...   Optional message for this frame.
 */
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage,cppcoreguidelines-avoid-do-while)
#define ASSIGN_OR_RETURN(lhs, expr, ...)                                     \
  do {                                                                       \
    auto _sor = (expr);                                                      \
    if (!_sor.ok()) {                                                        \
      return ::slidestream::status::AddTrace(_sor.status(), __func__,        \
                                             __FILE__, __LINE__,             \
                                             ##__VA_ARGS__);                 \
    }                                                                        \
    lhs = std::move(_sor).value();                                           \
  } while (0)

#endif  // SLIDESTREAM_INCLUDE_SLIDESTREAM_STATUS_STATUS_MACROS_H_
