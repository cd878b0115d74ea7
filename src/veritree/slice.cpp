#include "veritree/slice.hpp"
#include "veritree/errors.hpp"
#include "veritree/logger.h"
#include "veritree/tree_layout.hpp"
#include <algorithm>
#include <cstring>
#include <limits>

namespace veritree {

namespace {

uint64_t saturating_add(uint64_t a, uint64_t b) {
  if (a > std::numeric_limits<uint64_t>::max() - b) {
    return std::numeric_limits<uint64_t>::max();
  }
  return a + b;
}

} // namespace

SliceRange resolve_slice(uint64_t contentLen, uint64_t start, uint64_t count,
                         const SliceOptions &options) {
  if (count == 0 && options.zeroCount == ZeroCountPolicy::Reject) {
    ThrowBoundsError(start, count, contentLen);
  }
  if (options.bounds == BoundsPolicy::Strict) {
    bool overflows = start > std::numeric_limits<uint64_t>::max() - count;
    if (overflows || start + count > contentLen ||
        (contentLen > 0 && start >= contentLen)) {
      ThrowBoundsError(start, count, contentLen);
    }
  }

  SliceRange range;
  if (start >= contentLen) {
    // Only the final chunk, which proves the length.
    range.nodeStart = contentLen == 0 ? 0 : contentLen - 1;
    range.nodeEnd = contentLen;
    range.outStart = contentLen;
    range.outEnd = contentLen;
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Slice start " + std::to_string(start) +
                                  " clamped to the final chunk");
    return range;
  }

  const uint64_t requestedEnd = saturating_add(start, count);
  if (requestedEnd > contentLen) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Slice end " + std::to_string(requestedEnd) +
                                  " clamped to " + std::to_string(contentLen));
  }
  range.nodeStart = start;
  range.nodeEnd = std::min(saturating_add(start, std::max<uint64_t>(count, 1)),
                           contentLen);
  range.outStart = start;
  range.outEnd = std::min(requestedEnd, contentLen);
  return range;
}

SliceExtractor::SliceExtractor(SeekableReader &encoded, SliceOptions options)
    : encoded_(encoded), content_(nullptr), options_(options),
      mode_(EncodingMode::Combined) {}

SliceExtractor::SliceExtractor(SeekableReader &outboard,
                               SeekableReader &content, SliceOptions options)
    : encoded_(outboard), content_(&content), options_(options),
      mode_(EncodingMode::Outboard) {}

void SliceExtractor::copyAt(SeekableReader &reader, uint64_t &trackedPos,
                            uint64_t offset, uint64_t len, Writer &out) {
  if (trackedPos != offset) {
    reader.seek(offset);
    trackedPos = offset;
  }
  copyBuffer_.resize(static_cast<size_t>(len));
  read_exact(reader, copyBuffer_.data(), copyBuffer_.size());
  trackedPos += len;
  out.write(copyBuffer_.data(), copyBuffer_.size());
}

void SliceExtractor::walk(uint64_t start, uint64_t len, uint64_t encodedOffset,
                          const SliceRange &range, Writer &out) {
  if (!range.overlaps(start, len)) {
    return;
  }
  if (layout::is_chunk(len)) {
    if (content_) {
      copyAt(*content_, contentPos_, start, len, out);
    } else {
      copyAt(encoded_, encodedPos_, encodedOffset, len, out);
    }
    return;
  }
  copyAt(encoded_, encodedPos_, encodedOffset, PARENT_SIZE, out);
  const uint64_t leftLen = layout::left_len(len);
  const uint64_t leftOffset = encodedOffset + PARENT_SIZE;
  walk(start, leftLen, leftOffset, range, out);
  walk(start + leftLen, len - leftLen,
       leftOffset + layout::encoded_subtree_size(leftLen, mode_), range, out);
}

SliceRange SliceExtractor::extract(uint64_t start, uint64_t count,
                                   Writer &out) {
  LengthHeader header{};
  encoded_.seek(0);
  read_exact(encoded_, header.data(), header.size());
  encodedPos_ = HEADER_SIZE;
  contentPos_ = std::numeric_limits<uint64_t>::max();

  const uint64_t contentLen = layout::decode_len(header);
  if (mode_ == EncodingMode::Combined && !layout::is_encodable(contentLen)) {
    ThrowLengthOverflow(contentLen);
  }
  SliceRange range = resolve_slice(contentLen, start, count, options_);

  out.write(header.data(), header.size());
  walk(0, contentLen, HEADER_SIZE, range, out);

  Logger::getInstance().log(LogLevel::DEBUG,
                            "Extracted slice [" +
                                std::to_string(range.nodeStart) + ", " +
                                std::to_string(range.nodeEnd) + ")");
  return range;
}

SliceDecoder::SliceDecoder(Reader &slice, const Hash &root, uint64_t start,
                           uint64_t count,
                           std::shared_ptr<const Compressor> compressor,
                           SliceOptions options)
    : slice_(slice), state_(root, std::move(compressor), EncodingMode::Combined),
      start_(start), count_(count), options_(options) {}

void SliceDecoder::ensureHeader() {
  if (state_.header_read()) {
    return;
  }
  LengthHeader header{};
  read_exact(slice_, header.data(), header.size());
  state_.feed_header(header);
  range_ = resolve_slice(state_.declared_length(), start_, count_, options_);
  state_.seek_to(range_->nodeStart);
  position_ = range_->outStart;
}

void SliceDecoder::loadNextChunk() {
  while (true) {
    VerifyState::NextRead nr = state_.next();
    switch (nr.step) {
    case VerifyState::Step::Header:
      ensureHeader();
      break;
    case VerifyState::Step::Parent: {
      ParentNode node{};
      read_exact(slice_, node.data(), node.size());
      state_.feed_parent(node);
      break;
    }
    case VerifyState::Step::Chunk: {
      bufferValid_ = false;
      buffer_.resize(static_cast<size_t>(nr.size));
      read_exact(slice_, buffer_.data(), buffer_.size());
      state_.feed_chunk(buffer_);
      bufferStart_ = nr.contentStart;
      bufferValid_ = true;
      if (nr.contentStart + nr.size >= range_->nodeEnd) {
        finished_ = true;
      }
      return;
    }
    case VerifyState::Step::Done:
      finished_ = true;
      return;
    }
  }
}

size_t SliceDecoder::read(uint8_t *buf, size_t len) {
  if (len == 0) {
    return 0;
  }
  try {
    state_.check_usable();
    ensureHeader();
    while (true) {
      if (bufferValid_ && position_ >= bufferStart_ &&
          position_ < bufferStart_ + buffer_.size() &&
          position_ < range_->outEnd) {
        uint64_t offsetInChunk = position_ - bufferStart_;
        uint64_t available = std::min<uint64_t>(
            buffer_.size() - offsetInChunk, range_->outEnd - position_);
        size_t n = static_cast<size_t>(std::min<uint64_t>(len, available));
        std::memcpy(buf, buffer_.data() + offsetInChunk, n);
        position_ += n;
        return n;
      }
      if (finished_) {
        return 0;
      }
      loadNextChunk();
    }
  } catch (const TreeError &e) {
    state_.mark_failed(e.kind());
    throw;
  }
}

std::optional<SliceRange> SliceDecoder::range() const {
  if (!finished_ && !state_.length_verified()) {
    return std::nullopt;
  }
  return range_;
}

std::vector<uint8_t> SliceDecoder::read_all() {
  std::vector<uint8_t> out;
  std::vector<uint8_t> buf(static_cast<size_t>(CHUNK_SIZE) * 4);
  while (true) {
    size_t n = read(buf.data(), buf.size());
    if (n == 0)
      break;
    out.insert(out.end(), buf.begin(), buf.begin() + n);
  }
  return out;
}

} // namespace veritree
