#include "veritree/node_hasher.hpp"
#include <algorithm>
#include <sodium.h>

namespace veritree {

NodeParams chunk_params(uint64_t chunkIndex, bool isRoot) {
  NodeParams params;
  params.level = NodeLevel::Leaf;
  params.counter = static_cast<uint32_t>(chunkIndex); // wraps at 2^32
  params.finalize = isRoot;
  return params;
}

NodeParams parent_params(bool isRoot) {
  NodeParams params;
  params.level = NodeLevel::Interior;
  params.counter = 0;
  params.finalize = isRoot;
  return params;
}

Hash chunk_hash(const Compressor &compressor, std::span<const uint8_t> chunk,
                uint64_t chunkIndex, bool isRoot) {
  return compressor.compress(chunk, chunk_params(chunkIndex, isRoot));
}

Hash parent_hash(const Compressor &compressor, const ParentNode &node,
                 bool isRoot) {
  return compressor.compress(node, parent_params(isRoot));
}

Hash parent_hash(const Compressor &compressor, const Hash &left,
                 const Hash &right, bool isRoot) {
  return parent_hash(compressor, make_parent_node(left, right), isRoot);
}

ParentNode make_parent_node(const Hash &left, const Hash &right) {
  ParentNode node{};
  std::copy(left.begin(), left.end(), node.begin());
  std::copy(right.begin(), right.end(), node.begin() + DIGEST_SIZE);
  return node;
}

Hash left_half(const ParentNode &node) {
  Hash h{};
  std::copy(node.begin(), node.begin() + DIGEST_SIZE, h.begin());
  return h;
}

Hash right_half(const ParentNode &node) {
  Hash h{};
  std::copy(node.begin() + DIGEST_SIZE, node.end(), h.begin());
  return h;
}

bool hashes_equal(const Hash &a, const Hash &b) {
  return sodium_memcmp(a.data(), b.data(), DIGEST_SIZE) == 0;
}

} // namespace veritree
