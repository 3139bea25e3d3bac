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

#ifndef SLIDESTREAM_INCLUDE_SLIDESTREAM_CORE_GEOMETRY_H_
#define SLIDESTREAM_INCLUDE_SLIDESTREAM_CORE_GEOMETRY_H_

#include <algorithm>
#include <cstdint>
#include <ostream>

namespace slidestream {
namespace core {

/// @brief Integer pixel position (x grows right, y grows down)
///
/// This is an aggregate type to support designated initializers in C++20.
struct Point {
  int64_t x;  ///< Column in pixels
  int64_t y;  ///< Row in pixels

  bool operator==(const Point& other) const {
    return x == other.x && y == other.y;
  }
  bool operator!=(const Point& other) const { return !(*this == other); }
};

/// @brief Axis-aligned pixel rectangle
///
/// Half-open: [left, right) x [top, bottom).
///
/// This is an aggregate type to support designated initializers in C++20.
struct Rect {
  int64_t left;
  int64_t top;
  int64_t right;
  int64_t bottom;

  /// @brief Build from a top-left corner and a size
  static Rect FromBox(int64_t x, int64_t y, int64_t width, int64_t height) {
    return {x, y, x + width, y + height};
  }

  [[nodiscard]] int64_t Width() const { return right - left; }
  [[nodiscard]] int64_t Height() const { return bottom - top; }

  /// @brief True when the rectangle covers no pixel
  [[nodiscard]] bool IsEmpty() const { return right <= left || bottom <= top; }

  /// @brief Clamp a point into [left, right] x [top, bottom]
  [[nodiscard]] Point Clip(const Point& p) const {
    return {std::clamp(p.x, left, right), std::clamp(p.y, top, bottom)};
  }

  [[nodiscard]] bool Overlaps(const Rect& other) const {
    return right > other.left && left < other.right && bottom > other.top &&
           top < other.bottom;
  }

  bool operator==(const Rect& other) const {
    return left == other.left && top == other.top && right == other.right &&
           bottom == other.bottom;
  }
  bool operator!=(const Rect& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const Point& p) {
  return os << "(" << p.x << ", " << p.y << ")";
}

inline std::ostream& operator<<(std::ostream& os, const Rect& r) {
  return os << "<Rect (" << r.left << "," << r.top << ")-(" << r.right << ","
            << r.bottom << ")>";
}

}  // namespace core
}  // namespace slidestream

#endif  // SLIDESTREAM_INCLUDE_SLIDESTREAM_CORE_GEOMETRY_H_
