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

#include "slidestream/multipart/multipart_decoder.h"

#include <algorithm>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_format.h"
#include "slidestream/core/errors.h"
#include "slidestream/status/status_macros.h"

namespace slidestream {
namespace multipart {

namespace {

constexpr std::string_view kCrlf = "\r\n";
constexpr std::string_view kHeaderSeparator = "\r\n\r\n";
constexpr std::string_view kEndMarker = "--\r\n";

Bytes ToBytes(std::string_view text) {
  return Bytes(text.begin(), text.end());
}

}  // namespace

// ============================================================================
// PartBody
// ============================================================================

absl::StatusOr<std::optional<Bytes>> PartBody::Next() {
  return decoder_->NextBodyFragment(part_index_);
}

absl::StatusOr<Bytes> PartBody::ReadAll() {
  Bytes body;
  while (true) {
    std::optional<Bytes> fragment;
    ASSIGN_OR_RETURN(fragment, Next());
    if (!fragment.has_value()) {
      break;
    }
    body.insert(body.end(), fragment->begin(), fragment->end());
  }
  return body;
}

absl::Status PartBody::Discard() {
  while (true) {
    std::optional<Bytes> fragment;
    ASSIGN_OR_RETURN(fragment, Next());
    if (!fragment.has_value()) {
      return absl::OkStatus();
    }
  }
}

// ============================================================================
// MultipartDecoder
// ============================================================================

MultipartDecoder::MultipartDecoder(std::unique_ptr<ChunkSource> source,
                                   std::string_view boundary,
                                   DecoderOptions options)
    : source_(std::move(source)),
      start_boundary_(ToBytes(absl::StrFormat("--%s", boundary))),
      delimiter_(ToBytes(absl::StrFormat("\r\n--%s", boundary))),
      options_(options) {}

absl::StatusOr<std::unique_ptr<MultipartDecoder>> MultipartDecoder::Create(
    std::unique_ptr<ChunkSource> source, std::string_view boundary,
    DecoderOptions options) {
  if (source == nullptr) {
    return MAKE_STATUS(core::kInvalidArgument, "Chunk source is null");
  }
  if (boundary.empty()) {
    return MAKE_STATUS(core::kInvalidArgument, "Boundary must not be empty");
  }
  return std::unique_ptr<MultipartDecoder>(
      new MultipartDecoder(std::move(source), boundary, options));
}

absl::StatusOr<std::optional<Part>> MultipartDecoder::NextPart() {
  if (state_ == State::kFailed) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Multipart decoder already failed");
  }
  if (state_ == State::kTerminated) {
    return std::optional<Part>();
  }
  auto part_or = AdvanceToNextPart();
  // A part without filename leaves the framing intact; the next call skips
  // its body and resumes at the following boundary.
  if (!part_or.ok() && !core::IsFieldMissing(part_or.status())) {
    state_ = State::kFailed;
  }
  return part_or;
}

absl::StatusOr<std::optional<Part>> MultipartDecoder::AdvanceToNextPart() {
  if (state_ == State::kAwaitFirstBoundary) {
    RETURN_IF_ERROR(ReadStartBoundary(), "Reading first boundary");
    state_ = State::kHeaderParse;
  }

  if (state_ == State::kBodyStream) {
    LOG(WARNING) << "Discarding unread body of part " << part_index_ - 1;
  }
  while (state_ == State::kBodyStream) {
    std::optional<Bytes> skipped;
    ASSIGN_OR_RETURN(
        skipped, ScanBody(),
        absl::StrFormat("Skipping body of part %d", part_index_ - 1));
  }

  bool end_of_stream = false;
  ASSIGN_OR_RETURN(end_of_stream, CheckForEndOfStream());
  if (end_of_stream) {
    VLOG(1) << "End of multipart stream after " << part_index_ << " parts";
    state_ = State::kTerminated;
    return std::optional<Part>();
  }

  std::string header_block;
  ASSIGN_OR_RETURN(header_block, ReadHeaderBlock(),
                   absl::StrFormat("Reading headers of part %d", part_index_));
  PartHeaders headers = ParseHeaderBlock(header_block);
  const uint64_t index = part_index_++;
  state_ = State::kBodyStream;

  std::optional<std::string> filename;
  if (auto disposition = headers.Get("content-disposition")) {
    filename = ParseDispositionFilename(*disposition);
  }
  if (!filename.has_value() || filename->empty()) {
    return MAKE_STATUS(
        core::kFieldMissing,
        absl::StrFormat("Part %d has no filename in its Content-Disposition",
                        index));
  }

  VLOG(1) << "Parsing part " << index << " with filename " << *filename;
  std::optional<std::string> content_type = headers.Get("content-type");
  return std::optional<Part>(Part{std::move(*filename), std::move(content_type),
                                  std::move(headers),
                                  PartBody(this, part_index_)});
}

absl::StatusOr<std::optional<Bytes>> MultipartDecoder::NextBodyFragment(
    uint64_t part_index) {
  if (state_ == State::kFailed) {
    return MAKE_STATUS(absl::StatusCode::kFailedPrecondition,
                       "Multipart decoder already failed");
  }
  if (part_index != part_index_) {
    return MAKE_STATUS(
        absl::StatusCode::kFailedPrecondition,
        absl::StrFormat("Body of part %d read after decoder moved on",
                        part_index - 1));
  }
  if (state_ != State::kBodyStream) {
    return std::optional<Bytes>();
  }
  auto fragment_or = ScanBody();
  if (!fragment_or.ok()) {
    state_ = State::kFailed;
  }
  return fragment_or;
}

absl::StatusOr<std::optional<Bytes>> MultipartDecoder::ScanBody() {
  const size_t keep = delimiter_.size() - 1;
  while (true) {
    if (auto match = Find(delimiter_, 0)) {
      const size_t match_begin = head_ + *match;
      if (match_begin < chunk_begin_ &&
          match_begin + delimiter_.size() > chunk_begin_) {
        VLOG(1) << "Boundary found between chunks";
      }
      Bytes fragment(buffer_.begin() + head_, buffer_.begin() + match_begin);
      head_ = match_begin + delimiter_.size();
      state_ = State::kHeaderParse;
      if (fragment.empty()) {
        return std::optional<Bytes>();
      }
      return std::optional<Bytes>(std::move(fragment));
    }

    // Everything except a possible partial delimiter at the tail is body.
    if (Buffered() > keep) {
      const size_t emit_end = buffer_.size() - keep;
      Bytes fragment(buffer_.begin() + head_, buffer_.begin() + emit_end);
      head_ = emit_end;
      return std::optional<Bytes>(std::move(fragment));
    }

    bool more = false;
    ASSIGN_OR_RETURN(more, PullChunk());
    if (!more) {
      return MAKE_STATUS(core::kUnexpectedEndOfStream,
                         "Source ended inside a part body");
    }
  }
}

absl::Status MultipartDecoder::ReadStartBoundary() {
  bool complete = false;
  ASSIGN_OR_RETURN(complete, FillTo(start_boundary_.size()));
  const size_t available = std::min(Buffered(), start_boundary_.size());
  if (!std::equal(start_boundary_.begin(), start_boundary_.begin() + available,
                  buffer_.begin() + head_)) {
    return MAKE_STATUS(core::kProtocolViolation,
                       "Stream does not begin with expected boundary");
  }
  if (!complete) {
    return MAKE_STATUS(core::kUnexpectedEndOfStream,
                       "Source ended before the first boundary");
  }
  head_ += start_boundary_.size();
  return absl::OkStatus();
}

absl::StatusOr<bool> MultipartDecoder::CheckForEndOfStream() {
  bool complete = false;
  ASSIGN_OR_RETURN(complete, FillTo(kCrlf.size()));
  if (!complete) {
    return MAKE_STATUS(core::kUnexpectedEndOfStream,
                       "Source ended directly after a boundary");
  }
  if (BufferStartsWith(kCrlf)) {
    return false;
  }
  if (!BufferStartsWith("--")) {
    return MAKE_STATUS(core::kProtocolViolation,
                       "Boundary not followed by CRLF or end marker");
  }

  ASSIGN_OR_RETURN(complete, FillTo(kEndMarker.size()));
  if (!complete) {
    return MAKE_STATUS(core::kUnexpectedEndOfStream,
                       "Source ended inside the end marker");
  }
  if (!BufferStartsWith(kEndMarker) || Buffered() != kEndMarker.size()) {
    return MAKE_STATUS(core::kProtocolViolation,
                       "End boundary found mid-stream");
  }
  // The end marker only counts when the source is exhausted right after it.
  bool more = true;
  while (more) {
    ASSIGN_OR_RETURN(more, PullChunk());
    if (Buffered() > kEndMarker.size()) {
      return MAKE_STATUS(core::kProtocolViolation,
                         "End boundary found mid-stream");
    }
  }
  head_ = buffer_.size();
  return true;
}

absl::StatusOr<std::string> MultipartDecoder::ReadHeaderBlock() {
  const Bytes separator = ToBytes(kHeaderSeparator);
  const size_t limit = options_.max_header_bytes + kCrlf.size();
  size_t search_from = 0;
  while (true) {
    const std::optional<size_t> pos = Find(separator, search_from);
    // Without a match, the last bytes may still begin the separator.
    const size_t block_end =
        pos.value_or(Buffered() - std::min(Buffered(), separator.size() - 1));
    if (block_end > limit) {
      return MAKE_STATUS(
          core::kProtocolViolation,
          absl::StrFormat("Part header block exceeds %zu bytes",
                          options_.max_header_bytes));
    }
    if (pos.has_value()) {
      // The block starts right after the CRLF that ends the boundary line.
      std::string block;
      if (*pos > kCrlf.size()) {
        block.assign(buffer_.begin() + head_ + kCrlf.size(),
                     buffer_.begin() + head_ + *pos);
      }
      head_ += *pos + separator.size();
      return block;
    }
    search_from = Buffered() >= separator.size()
                      ? Buffered() - (separator.size() - 1)
                      : 0;
    bool more = false;
    ASSIGN_OR_RETURN(more, PullChunk());
    if (!more) {
      return MAKE_STATUS(core::kUnexpectedEndOfStream,
                         "Source ended inside a part header block");
    }
  }
}

absl::StatusOr<bool> MultipartDecoder::PullChunk() {
  if (source_done_) {
    return false;
  }
  std::optional<Bytes> chunk;
  ASSIGN_OR_RETURN(chunk, source_->Next(), "Pulling chunk from source");
  if (!chunk.has_value()) {
    source_done_ = true;
    return false;
  }
  if (head_ > 0) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + head_);
    head_ = 0;
  }
  chunk_begin_ = buffer_.size();
  buffer_.insert(buffer_.end(), chunk->begin(), chunk->end());
  return true;
}

absl::StatusOr<bool> MultipartDecoder::FillTo(size_t n) {
  while (Buffered() < n) {
    bool more = false;
    ASSIGN_OR_RETURN(more, PullChunk());
    if (!more) {
      return false;
    }
  }
  return true;
}

std::optional<size_t> MultipartDecoder::Find(const Bytes& needle,
                                             size_t from) const {
  if (from >= Buffered()) {
    return std::nullopt;
  }
  const auto begin = buffer_.begin() + head_;
  const auto it =
      std::search(begin + from, buffer_.end(), needle.begin(), needle.end());
  if (it == buffer_.end()) {
    return std::nullopt;
  }
  return static_cast<size_t>(it - begin);
}

bool MultipartDecoder::BufferStartsWith(std::string_view prefix) const {
  return Buffered() >= prefix.size() &&
         std::equal(prefix.begin(), prefix.end(), buffer_.begin() + head_);
}

}  // namespace multipart
}  // namespace slidestream
