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

#ifndef SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_MULTIPART_DECODER_H_
#define SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_MULTIPART_DECODER_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "slidestream/multipart/chunk_source.h"
#include "slidestream/multipart/headers.h"

/**
 * @file multipart_decoder.h
 * @brief Streaming decoder for multipart/related response bodies
 *
 * Splits a byte stream of the form
 *
 *     --B\r\n<headers>\r\n\r\n<body>\r\n--B\r\n<headers>...\r\n--B--\r\n
 *
 * into (filename, body) parts while holding at most one chunk plus a few
 * bytes of look-back in memory. Bodies are handed out as lazy fragment
 * sequences, so a multi-gigabyte WSI file can be streamed straight to disk.
 *
 * Example usage:
 * @code
 * std::unique_ptr<MultipartDecoder> decoder;
 * ASSIGN_OR_RETURN(decoder,
 *                  MultipartDecoder::Create(std::move(source), boundary));
 * while (true) {
 *   std::optional<Part> part;
 *   ASSIGN_OR_RETURN(part, decoder->NextPart());
 *   if (!part) break;
 *   while (true) {
 *     std::optional<Bytes> fragment;
 *     ASSIGN_OR_RETURN(fragment, part->body.Next());
 *     if (!fragment) break;
 *     Consume(part->filename, *fragment);
 *   }
 * }
 * @endcode
 *
 * A decoder is single-reader: it is not thread-safe, and a part's body must
 * be consumed before the next part is requested (NextPart() discards any
 * unread remainder).
 */

namespace slidestream {
namespace multipart {

class MultipartDecoder;

/// @brief Decoder configuration
struct DecoderOptions {
  /// @brief Upper bound on one part's header block, in bytes
  ///
  /// A header block that grows past this without its terminating blank line
  /// is treated as a protocol violation.
  size_t max_header_bytes = 16 * 1024;
};

/// @brief Lazy byte sequence of one part's body
///
/// Valid while its decoder is alive and has not moved on to a later part.
class PartBody {
 public:
  /// @brief Next fragment of the body
  /// @return A non-empty fragment, or std::nullopt once the body is complete
  absl::StatusOr<std::optional<Bytes>> Next();

  /// @brief Concatenate the remaining fragments
  absl::StatusOr<Bytes> ReadAll();

  /// @brief Skip the remaining fragments
  absl::Status Discard();

 private:
  friend class MultipartDecoder;

  PartBody(MultipartDecoder* decoder, uint64_t part_index)
      : decoder_(decoder), part_index_(part_index) {}

  MultipartDecoder* decoder_;
  uint64_t part_index_;
};

/// @brief One named payload of a multipart stream
struct Part {
  std::string filename;                     ///< From Content-Disposition
  std::optional<std::string> content_type;  ///< Part Content-Type, if any
  PartHeaders headers;                      ///< All header fields
  PartBody body;                            ///< Lazy body
};

/// @brief Single-pass, pull-based multipart stream decoder
class MultipartDecoder {
 public:
  /// @brief Decoder states
  enum class State {
    kAwaitFirstBoundary,  ///< Nothing consumed yet
    kHeaderParse,         ///< A boundary was consumed; headers or end next
    kBodyStream,          ///< Inside a part body
    kTerminated,          ///< End marker seen and source exhausted
    kFailed,              ///< A fatal error occurred; decoder unusable
  };

  /// @brief Create a decoder over a chunk source
  /// @param source Chunks of the response body; owned by the decoder
  /// @param boundary Boundary token without the leading "--"
  /// @param options Decoder configuration
  /// @retval absl::InvalidArgumentError for an empty boundary or null source
  static absl::StatusOr<std::unique_ptr<MultipartDecoder>> Create(
      std::unique_ptr<ChunkSource> source, std::string_view boundary,
      DecoderOptions options = {});

  MultipartDecoder(const MultipartDecoder&) = delete;
  MultipartDecoder& operator=(const MultipartDecoder&) = delete;

  /// @brief Advance to the next part
  ///
  /// Unread body bytes of the previous part are discarded first.
  /// @return The part, or std::nullopt once the end marker was reached
  /// @retval kProtocolViolation stream does not follow the multipart grammar
  /// @retval kFieldMissing part has no filename; calling NextPart() again
  ///         skips that part and continues
  /// @retval kUnexpectedEndOfStream source ended inside a construct
  /// @retval absl::FailedPreconditionError after an earlier fatal error
  absl::StatusOr<std::optional<Part>> NextPart();

  [[nodiscard]] State GetState() const { return state_; }

  /// @brief Number of part headers parsed so far
  [[nodiscard]] uint64_t GetPartCount() const { return part_index_; }

 private:
  friend class PartBody;

  MultipartDecoder(std::unique_ptr<ChunkSource> source,
                   std::string_view boundary, DecoderOptions options);

  absl::StatusOr<std::optional<Part>> AdvanceToNextPart();
  absl::StatusOr<std::optional<Bytes>> NextBodyFragment(uint64_t part_index);
  absl::StatusOr<std::optional<Bytes>> ScanBody();

  absl::Status ReadStartBoundary();
  absl::StatusOr<bool> CheckForEndOfStream();
  absl::StatusOr<std::string> ReadHeaderBlock();

  /// @brief Append the next chunk to the buffer
  /// @return false when the source is exhausted
  absl::StatusOr<bool> PullChunk();

  /// @brief Pull until at least n bytes are buffered
  /// @return false if the source ended first
  absl::StatusOr<bool> FillTo(size_t n);

  /// @brief Position of needle in the unread buffer, from offset `from`
  [[nodiscard]] std::optional<size_t> Find(const Bytes& needle,
                                           size_t from) const;
  [[nodiscard]] bool BufferStartsWith(std::string_view prefix) const;
  [[nodiscard]] size_t Buffered() const { return buffer_.size() - head_; }

  std::unique_ptr<ChunkSource> source_;
  Bytes start_boundary_;  ///< "--" + boundary
  Bytes delimiter_;       ///< "\r\n--" + boundary
  DecoderOptions options_;

  Bytes buffer_;             ///< Bytes read but not yet handed out
  size_t head_ = 0;          ///< Start of unread data within buffer_
  size_t chunk_begin_ = 0;   ///< Where the most recent chunk starts
  bool source_done_ = false;

  State state_ = State::kAwaitFirstBoundary;
  uint64_t part_index_ = 0;
};

}  // namespace multipart
}  // namespace slidestream

#endif  // SLIDESTREAM_INCLUDE_SLIDESTREAM_MULTIPART_MULTIPART_DECODER_H_
