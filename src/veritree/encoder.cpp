#include "veritree/encoder.hpp"
#include "veritree/logger.h"
#include "veritree/node_hasher.hpp"
#include <stdexcept>

namespace veritree {

Encoder::Encoder(std::shared_ptr<const Compressor> compressor,
                 EncodingMode mode)
    : compressor_(std::move(compressor)), mode_(mode) {
  if (!compressor_) {
    throw std::invalid_argument("Encoder requires a compressor");
  }
}

EncodeResult Encoder::encode(std::span<const uint8_t> input) const {
  VectorWriter writer;
  EncodeResult result;
  result.root = encode_to(input, writer);
  result.encoding = writer.take();
  return result;
}

Hash Encoder::encode_to(std::span<const uint8_t> input,
                        SeekableWriter &out) const {
  const uint64_t contentLen = input.size();
  // Rejects lengths whose encoding would not be addressable.
  const uint64_t total = layout::encoded_size(contentLen, mode_);

  LengthHeader header = layout::encode_len(contentLen);
  out.write_at(0, header.data(), header.size());
  Hash root = encodeSubtree(input, 0, HEADER_SIZE, true, out);

  Logger::getInstance().log(
      LogLevel::DEBUG,
      std::string("Encoded ") + std::to_string(contentLen) + " bytes into " +
          std::to_string(total) + " byte " +
          (mode_ == EncodingMode::Outboard ? "outboard" : "combined") +
          " encoding");
  return root;
}

Hash Encoder::encodeSubtree(std::span<const uint8_t> input,
                            uint64_t contentOffset, uint64_t encodedOffset,
                            bool isRoot, SeekableWriter &out) const {
  const uint64_t len = input.size();
  if (layout::is_chunk(len)) {
    if (mode_ == EncodingMode::Combined && len > 0) {
      out.write_at(encodedOffset, input.data(), input.size());
    }
    return chunk_hash(*compressor_, input, layout::chunk_index(contentOffset),
                      isRoot);
  }

  const uint64_t leftLen = layout::left_len(len);
  const uint64_t leftOffset = encodedOffset + PARENT_SIZE;
  const uint64_t rightOffset =
      leftOffset + layout::encoded_subtree_size(leftLen, mode_);

  Hash left = encodeSubtree(input.first(leftLen), contentOffset, leftOffset,
                            false, out);
  Hash right = encodeSubtree(input.subspan(leftLen), contentOffset + leftLen,
                             rightOffset, false, out);

  ParentNode node = make_parent_node(left, right);
  out.write_at(encodedOffset, node.data(), node.size());
  return parent_hash(*compressor_, node, isRoot);
}

} // namespace veritree
