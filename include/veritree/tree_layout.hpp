#ifndef VERITREE_TREE_LAYOUT_HPP
#define VERITREE_TREE_LAYOUT_HPP

#include <array>
#include <cstddef>
#include <cstdint>

/**
 * @file tree_layout.hpp
 * @brief Shape of the hash tree as a pure function of the content length.
 *
 * Every component (hashing, encoding, decoding, slicing) derives node
 * boundaries from left_len() only. The tree is never materialized: a node is
 * identified by the byte range it covers.
 */

namespace veritree {

inline constexpr uint64_t CHUNK_SIZE = 4096;
inline constexpr uint64_t HEADER_SIZE = 8;
inline constexpr uint64_t PARENT_SIZE = 64;
/// Height of the tree for a content length of 2^64 - 1.
inline constexpr size_t MAX_DEPTH = 52;

/// Whether an encoding carries chunk payloads inline.
enum class EncodingMode { Combined, Outboard };

using LengthHeader = std::array<uint8_t, HEADER_SIZE>;

namespace layout {

/**
 * @brief Size of the left subtree of a node covering @p contentLen bytes.
 *
 * The largest power of two times CHUNK_SIZE strictly less than the length.
 * Only meaningful when @p contentLen > CHUNK_SIZE; the right subtree gets
 * the remaining (non-zero) bytes.
 */
uint64_t left_len(uint64_t contentLen);

/// A node covering @p contentLen bytes is a single chunk.
inline bool is_chunk(uint64_t contentLen) { return contentLen <= CHUNK_SIZE; }

/// Number of chunks, at least one (the empty chunk).
uint64_t count_chunks(uint64_t contentLen);

/// Index of the chunk containing @p offset, used as the hashing counter.
inline uint64_t chunk_index(uint64_t offset) { return offset / CHUNK_SIZE; }

/**
 * @brief Encoded size of a subtree covering @p contentLen bytes, header
 * excluded.
 * @throws LengthOverflowError if the size does not fit in 64 bits.
 */
uint64_t encoded_subtree_size(uint64_t contentLen, EncodingMode mode);

/**
 * @brief Total encoded size including the length header.
 * @throws LengthOverflowError if the size does not fit in 64 bits.
 */
uint64_t encoded_size(uint64_t contentLen, EncodingMode mode);

/// True if a combined encoding of @p contentLen bytes is addressable.
bool is_encodable(uint64_t contentLen);

/// Depth of the tree (0 for a single chunk).
size_t tree_height(uint64_t contentLen);

/// Little-endian length header.
LengthHeader encode_len(uint64_t contentLen);
uint64_t decode_len(const LengthHeader &header);

} // namespace layout

} // namespace veritree

#endif // VERITREE_TREE_LAYOUT_HPP
