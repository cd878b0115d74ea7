#include "veritree/tree_layout.hpp"
#include "veritree/errors.hpp"
#include <limits>

namespace veritree {
namespace layout {

namespace {

bool checked_add(uint64_t a, uint64_t b, uint64_t &out) {
  if (a > std::numeric_limits<uint64_t>::max() - b) {
    return false;
  }
  out = a + b;
  return true;
}

bool checked_mul(uint64_t a, uint64_t b, uint64_t &out) {
  if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
    return false;
  }
  out = a * b;
  return true;
}

// Size of the subtree, or false when it cannot be represented.
bool try_subtree_size(uint64_t contentLen, EncodingMode mode, uint64_t &out) {
  uint64_t parents = count_chunks(contentLen) - 1;
  uint64_t parentBytes = 0;
  if (!checked_mul(parents, PARENT_SIZE, parentBytes)) {
    return false;
  }
  if (mode == EncodingMode::Outboard) {
    out = parentBytes;
    return true;
  }
  return checked_add(parentBytes, contentLen, out);
}

} // namespace

uint64_t left_len(uint64_t contentLen) {
  // Chunks that must go left so that the right side is non-empty.
  uint64_t fullChunks = (contentLen - 1) / CHUNK_SIZE;
  uint64_t chunks = 1;
  while (chunks <= fullChunks / 2) {
    chunks <<= 1;
  }
  return chunks * CHUNK_SIZE;
}

uint64_t count_chunks(uint64_t contentLen) {
  if (contentLen == 0) {
    return 1;
  }
  return (contentLen - 1) / CHUNK_SIZE + 1;
}

uint64_t encoded_subtree_size(uint64_t contentLen, EncodingMode mode) {
  uint64_t size = 0;
  if (!try_subtree_size(contentLen, mode, size)) {
    ThrowLengthOverflow(contentLen);
  }
  return size;
}

uint64_t encoded_size(uint64_t contentLen, EncodingMode mode) {
  uint64_t total = 0;
  if (!checked_add(encoded_subtree_size(contentLen, mode), HEADER_SIZE,
                   total)) {
    ThrowLengthOverflow(contentLen);
  }
  return total;
}

bool is_encodable(uint64_t contentLen) {
  uint64_t size = 0;
  return try_subtree_size(contentLen, EncodingMode::Combined, size) &&
         checked_add(size, HEADER_SIZE, size);
}

size_t tree_height(uint64_t contentLen) {
  size_t height = 0;
  uint64_t chunks = count_chunks(contentLen);
  while ((uint64_t{1} << height) < chunks) {
    ++height;
  }
  return height;
}

LengthHeader encode_len(uint64_t contentLen) {
  LengthHeader header{};
  for (size_t i = 0; i < HEADER_SIZE; ++i) {
    header[i] = static_cast<uint8_t>(contentLen >> (8 * i));
  }
  return header;
}

uint64_t decode_len(const LengthHeader &header) {
  uint64_t len = 0;
  for (size_t i = 0; i < HEADER_SIZE; ++i) {
    len |= static_cast<uint64_t>(header[i]) << (8 * i);
  }
  return len;
}

} // namespace layout
} // namespace veritree
