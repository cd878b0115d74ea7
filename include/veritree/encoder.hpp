#ifndef VERITREE_ENCODER_HPP
#define VERITREE_ENCODER_HPP

#include "veritree/compressor.hpp"
#include "veritree/io.hpp"
#include "veritree/tree_layout.hpp"
#include <memory>
#include <span>
#include <vector>

namespace veritree {

/// Output of Encoder::encode().
struct EncodeResult {
  Hash root{};
  std::vector<uint8_t> encoding;
};

/**
 * @brief Serializes the tree of an input in combined or outboard form.
 *
 * Layout: 8-byte little-endian content length, then the nodes in pre-order.
 * A parent's 64-byte value (left hash, right hash) precedes its left and
 * right subtrees. The combined form carries chunk bytes at the leaves; the
 * outboard form omits them and keeps parents at the same relative order.
 */
class Encoder {
public:
  explicit Encoder(std::shared_ptr<const Compressor> compressor,
                   EncodingMode mode = EncodingMode::Combined);

  /**
   * @brief Encode @p input into memory.
   * @throw LengthOverflowError if the encoding cannot be addressed.
   */
  EncodeResult encode(std::span<const uint8_t> input) const;

  /**
   * @brief Encode @p input into @p out starting at offset 0.
   *
   * Every node is written at its final offset, computed from the layout, as
   * soon as its hash is known. Children are written before their parent.
   *
   * @return Root hash of the input.
   */
  Hash encode_to(std::span<const uint8_t> input, SeekableWriter &out) const;

  EncodingMode mode() const { return mode_; }

private:
  Hash encodeSubtree(std::span<const uint8_t> input, uint64_t contentOffset,
                     uint64_t encodedOffset, bool isRoot,
                     SeekableWriter &out) const;

  std::shared_ptr<const Compressor> compressor_;
  EncodingMode mode_;
};

} // namespace veritree

#endif // VERITREE_ENCODER_HPP
