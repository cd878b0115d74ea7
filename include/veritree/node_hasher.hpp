#ifndef VERITREE_NODE_HASHER_HPP
#define VERITREE_NODE_HASHER_HPP

#include "veritree/compressor.hpp"
#include "veritree/tree_layout.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace veritree {

/// A parent node as stored in an encoding: left hash followed by right hash.
using ParentNode = std::array<uint8_t, PARENT_SIZE>;

NodeParams chunk_params(uint64_t chunkIndex, bool isRoot);
NodeParams parent_params(bool isRoot);

/**
 * @brief Hash of one chunk.
 * @param chunkIndex Position of the chunk in the content; only the low 32
 *        bits reach the primitive.
 * @param isRoot True only when the chunk is the whole content.
 */
Hash chunk_hash(const Compressor &compressor, std::span<const uint8_t> chunk,
                uint64_t chunkIndex, bool isRoot);

Hash parent_hash(const Compressor &compressor, const ParentNode &node,
                 bool isRoot);
Hash parent_hash(const Compressor &compressor, const Hash &left,
                 const Hash &right, bool isRoot);

ParentNode make_parent_node(const Hash &left, const Hash &right);
Hash left_half(const ParentNode &node);
Hash right_half(const ParentNode &node);

/// Constant-time comparison of two hashes.
bool hashes_equal(const Hash &a, const Hash &b);

} // namespace veritree

#endif // VERITREE_NODE_HASHER_HPP
