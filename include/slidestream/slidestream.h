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

#ifndef SLIDESTREAM_INCLUDE_SLIDESTREAM_SLIDESTREAM_H_
#define SLIDESTREAM_INCLUDE_SLIDESTREAM_SLIDESTREAM_H_

/// @file slidestream.h
/// @brief Umbrella header: pyramid addressing and multipart decoding

#include "slidestream/core/errors.h"
#include "slidestream/core/geometry.h"
#include "slidestream/multipart/chunk_source.h"
#include "slidestream/multipart/headers.h"
#include "slidestream/multipart/multipart_decoder.h"
#include "slidestream/multipart/part_writer.h"
#include "slidestream/pyramid/pyramid_descriptor.h"
#include "slidestream/runtime/io/file_reader.h"

#endif  // SLIDESTREAM_INCLUDE_SLIDESTREAM_SLIDESTREAM_H_
