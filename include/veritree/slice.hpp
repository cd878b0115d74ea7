#ifndef VERITREE_SLICE_HPP
#define VERITREE_SLICE_HPP

#include "veritree/compressor.hpp"
#include "veritree/io.hpp"
#include "veritree/verify_state.hpp"
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <vector>

namespace veritree {

/// Handling of requests reaching past the end of the content.
enum class BoundsPolicy {
  Clamp, ///< Shorten the request; a start past the end selects the final chunk
  Strict ///< Reject with BoundsError
};

/// Handling of a zero byte count.
enum class ZeroCountPolicy {
  ExpandToOne, ///< Select the chunk containing the start offset
  Reject       ///< Reject with BoundsError
};

struct SliceOptions {
  BoundsPolicy bounds = BoundsPolicy::Clamp;
  ZeroCountPolicy zeroCount = ZeroCountPolicy::ExpandToOne;
};

/**
 * @brief A slice request resolved against a content length.
 *
 * Nodes overlapping [nodeStart, nodeEnd) go into the slice; the decoder
 * returns the bytes of [outStart, outEnd). The node range is never empty
 * for non-empty content, so a slice always carries at least one chunk.
 */
struct SliceRange {
  uint64_t nodeStart{0};
  uint64_t nodeEnd{0};
  uint64_t outStart{0};
  uint64_t outEnd{0};

  /// The node covering [start, start + len) belongs to the slice.
  bool overlaps(uint64_t start, uint64_t len) const {
    return len == 0 || (start < nodeEnd && start + len > nodeStart);
  }
};

/**
 * @brief Resolve (start, count) against @p contentLen under @p options.
 * @throw BoundsError when the policy rejects the request.
 */
SliceRange resolve_slice(uint64_t contentLen, uint64_t start, uint64_t count,
                         const SliceOptions &options);

/**
 * @brief Copies the nodes needed to verify a byte range.
 *
 * Reads a combined encoding, or an outboard encoding plus the content, and
 * writes a slice in combined format. Subtrees outside the range are skipped
 * by seeking. Nothing is verified here; the SliceDecoder does that.
 */
class SliceExtractor {
public:
  explicit SliceExtractor(SeekableReader &encoded, SliceOptions options = {});
  SliceExtractor(SeekableReader &outboard, SeekableReader &content,
                 SliceOptions options = {});

  /**
   * @brief Write the slice for (start, count) to @p out.
   * @return The resolved range.
   * @throw BoundsError, LengthOverflowError, TruncatedInputError
   */
  SliceRange extract(uint64_t start, uint64_t count, Writer &out);

private:
  void copyAt(SeekableReader &reader, uint64_t &trackedPos, uint64_t offset,
              uint64_t len, Writer &out);
  void walk(uint64_t start, uint64_t len, uint64_t encodedOffset,
            const SliceRange &range, Writer &out);

  SeekableReader &encoded_;
  SeekableReader *content_;
  SliceOptions options_;
  EncodingMode mode_;
  uint64_t encodedPos_{0};
  uint64_t contentPos_{std::numeric_limits<uint64_t>::max()};
  std::vector<uint8_t> copyBuffer_;
};

/**
 * @brief Verifying reader over a slice.
 *
 * Consumes the slice strictly sequentially. It expects exactly the nodes the
 * extractor emits for the same (start, count, options) and returns only the
 * bytes of the requested range, each one after its chunk was verified.
 */
class SliceDecoder {
public:
  SliceDecoder(Reader &slice, const Hash &root, uint64_t start, uint64_t count,
               std::shared_ptr<const Compressor> compressor,
               SliceOptions options = {});

  /**
   * @return Bytes copied; 0 once every node of the slice was verified and
   *         the requested range is exhausted.
   */
  size_t read(uint8_t *buf, size_t len);

  std::vector<uint8_t> read_all();

  /**
   * @brief Resolved range.
   *
   * Derived from the declared length, so it stays empty until every node of
   * the slice was verified (which includes the final chunk whenever the
   * range reaches the end of the content).
   */
  std::optional<SliceRange> range() const;

private:
  void ensureHeader();
  void loadNextChunk();

  Reader &slice_;
  VerifyState state_;
  uint64_t start_;
  uint64_t count_;
  SliceOptions options_;
  std::optional<SliceRange> range_;
  std::vector<uint8_t> buffer_;
  uint64_t bufferStart_{0};
  bool bufferValid_{false};
  uint64_t position_{0};
  bool finished_{false};
};

} // namespace veritree

#endif // VERITREE_SLICE_HPP
