#ifndef VERITREE_DECODER_HPP
#define VERITREE_DECODER_HPP

#include "veritree/compressor.hpp"
#include "veritree/io.hpp"
#include "veritree/verify_state.hpp"
#include <cstdint>
#include <limits>
#include <memory>
#include <vector>

namespace veritree {

enum class Whence { Begin, Current, End };

/**
 * @brief Verifying reader over a combined or outboard encoding.
 *
 * Only authenticated bytes are returned. The content length is revealed
 * (content_length(), end of stream, end-relative seeks) only after the final
 * chunk has been verified, which is what detects a forged length header.
 *
 * A Decoder is a single-threaded session. After any TreeError it must be
 * discarded; every later call fails with the same error kind.
 */
class Decoder {
public:
  /// Combined encoding: parents and chunk bytes in @p encoded.
  Decoder(SeekableReader &encoded, const Hash &root,
          std::shared_ptr<const Compressor> compressor);

  /// Outboard encoding: parents in @p outboard, chunk bytes in @p content.
  Decoder(SeekableReader &outboard, SeekableReader &content, const Hash &root,
          std::shared_ptr<const Compressor> compressor);

  /**
   * @brief Read authenticated content from the current position.
   * @return Bytes copied; 0 only at end of content (or if @p len is 0).
   */
  size_t read(uint8_t *buf, size_t len);

  /**
   * @brief Move the read position.
   *
   * Seeks relative to the end, or landing at or past the end, verify the
   * final chunk first. Other seeks are lazy: nothing is read until the next
   * read() call, which skips subtrees that do not contain the position.
   *
   * @return The new absolute position.
   * @throw std::invalid_argument if the position would be negative.
   */
  uint64_t seek(int64_t offset, Whence whence = Whence::Begin);

  /// Verified content length.
  uint64_t content_length();

  uint64_t position() const { return position_; }

  /// Read from the current position to the end.
  std::vector<uint8_t> read_all();

private:
  template <typename F> auto guarded(F &&fn) -> decltype(fn());

  void ensureHeader();
  // Verify nodes until a chunk is authenticated; false at end of content.
  bool loadChunkAt(uint64_t target);
  void verifyFinalChunk();
  void readNodeBytes(SeekableReader &reader, uint64_t &trackedPos,
                     uint64_t offset, uint8_t *buf, size_t len);
  bool bufferHolds(uint64_t pos) const;

  SeekableReader &encoded_;
  SeekableReader *content_;
  VerifyState state_;
  uint64_t position_{0};
  std::vector<uint8_t> buffer_;
  uint64_t bufferStart_{0};
  bool bufferValid_{false};
  // Reader positions as last left by this decoder; the initial value forces
  // a seek since the caller may hand over readers at any offset.
  uint64_t encodedPos_{std::numeric_limits<uint64_t>::max()};
  uint64_t contentPos_{std::numeric_limits<uint64_t>::max()};
};

} // namespace veritree

#endif // VERITREE_DECODER_HPP
