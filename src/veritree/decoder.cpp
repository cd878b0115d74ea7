#include "veritree/decoder.hpp"
#include "veritree/logger.h"
#include <algorithm>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace veritree {

Decoder::Decoder(SeekableReader &encoded, const Hash &root,
                 std::shared_ptr<const Compressor> compressor)
    : encoded_(encoded), content_(nullptr),
      state_(root, std::move(compressor), EncodingMode::Combined) {}

Decoder::Decoder(SeekableReader &outboard, SeekableReader &content,
                 const Hash &root, std::shared_ptr<const Compressor> compressor)
    : encoded_(outboard), content_(&content),
      state_(root, std::move(compressor), EncodingMode::Outboard) {}

template <typename F> auto Decoder::guarded(F &&fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const TreeError &e) {
    state_.mark_failed(e.kind());
    throw;
  }
}

void Decoder::readNodeBytes(SeekableReader &reader, uint64_t &trackedPos,
                            uint64_t offset, uint8_t *buf, size_t len) {
  if (trackedPos != offset) {
    reader.seek(offset);
    trackedPos = offset;
  }
  read_exact(reader, buf, len);
  trackedPos += len;
}

void Decoder::ensureHeader() {
  if (state_.header_read()) {
    return;
  }
  LengthHeader header{};
  readNodeBytes(encoded_, encodedPos_, 0, header.data(), header.size());
  state_.feed_header(header);
}

bool Decoder::bufferHolds(uint64_t pos) const {
  return bufferValid_ && pos >= bufferStart_ &&
         pos < bufferStart_ + buffer_.size();
}

bool Decoder::loadChunkAt(uint64_t target) {
  state_.seek_to(target);
  while (true) {
    VerifyState::NextRead nr = state_.next();
    switch (nr.step) {
    case VerifyState::Step::Header:
      ensureHeader();
      break;
    case VerifyState::Step::Parent: {
      ParentNode node{};
      readNodeBytes(encoded_, encodedPos_, nr.encodedOffset, node.data(),
                    node.size());
      state_.feed_parent(node);
      break;
    }
    case VerifyState::Step::Chunk: {
      bufferValid_ = false;
      buffer_.resize(static_cast<size_t>(nr.size));
      if (content_) {
        readNodeBytes(*content_, contentPos_, nr.contentStart, buffer_.data(),
                      buffer_.size());
      } else {
        readNodeBytes(encoded_, encodedPos_, nr.encodedOffset, buffer_.data(),
                      buffer_.size());
      }
      state_.feed_chunk(buffer_);
      bufferStart_ = nr.contentStart;
      bufferValid_ = true;
      return true;
    }
    case VerifyState::Step::Done:
      return false;
    }
  }
}

void Decoder::verifyFinalChunk() {
  ensureHeader();
  while (!state_.length_verified()) {
    if (!loadChunkAt(state_.declared_length())) {
      throw std::logic_error("Decoder: traversal ended before final chunk");
    }
  }
}

size_t Decoder::read(uint8_t *buf, size_t len) {
  if (len == 0) {
    return 0;
  }
  return guarded([&]() -> size_t {
    state_.check_usable();
    ensureHeader();
    if (!bufferHolds(position_)) {
      if (state_.length_verified() &&
          position_ >= state_.declared_length()) {
        return 0;
      }
      if (!loadChunkAt(position_) || !bufferHolds(position_)) {
        // Position at or past the end; the final chunk is now verified.
        return 0;
      }
    }
    uint64_t offsetInChunk = position_ - bufferStart_;
    size_t n = static_cast<size_t>(
        std::min<uint64_t>(len, buffer_.size() - offsetInChunk));
    std::memcpy(buf, buffer_.data() + offsetInChunk, n);
    position_ += n;
    return n;
  });
}

uint64_t Decoder::seek(int64_t offset, Whence whence) {
  return guarded([&]() -> uint64_t {
    ensureHeader();
    uint64_t base = 0;
    if (whence == Whence::Current) {
      base = position_;
    } else if (whence == Whence::End) {
      verifyFinalChunk();
      base = state_.declared_length();
    }

    uint64_t target = 0;
    if (offset < 0) {
      uint64_t back = static_cast<uint64_t>(-(offset + 1)) + 1;
      if (back > base) {
        throw std::invalid_argument("Decoder::seek: negative position");
      }
      target = base - back;
    } else {
      uint64_t fwd = static_cast<uint64_t>(offset);
      if (fwd > std::numeric_limits<uint64_t>::max() - base) {
        throw std::invalid_argument("Decoder::seek: position overflows");
      }
      target = base + fwd;
    }

    if (target >= state_.declared_length()) {
      verifyFinalChunk();
    }
    position_ = target;
    return position_;
  });
}

uint64_t Decoder::content_length() {
  return guarded([&]() -> uint64_t {
    verifyFinalChunk();
    return state_.declared_length();
  });
}

std::vector<uint8_t> Decoder::read_all() {
  std::vector<uint8_t> out;
  std::vector<uint8_t> buf(static_cast<size_t>(CHUNK_SIZE) * 16);
  while (true) {
    size_t n = read(buf.data(), buf.size());
    if (n == 0)
      break;
    out.insert(out.end(), buf.begin(), buf.begin() + n);
  }
  return out;
}

} // namespace veritree
