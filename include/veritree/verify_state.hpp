#ifndef VERITREE_VERIFY_STATE_HPP
#define VERITREE_VERIFY_STATE_HPP

#include "veritree/compressor.hpp"
#include "veritree/errors.hpp"
#include "veritree/node_hasher.hpp"
#include "veritree/tree_layout.hpp"
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace veritree {

/**
 * @brief Verification state machine shared by Decoder and SliceDecoder.
 *
 * Performs no I/O. The driver asks next() which node must be read, reads
 * exactly that many bytes and feeds them back. Each node is hashed and
 * compared with the hash its parent committed to; a parent's halves become
 * the expected hashes of its children.
 *
 * Pending nodes live on an explicit stack of frames, top being the leftmost
 * unread node. The frames always cover a contiguous range ending at the
 * declared length, so a driver can suspend between any two calls.
 */
class VerifyState {
public:
  enum class Step { Header, Parent, Chunk, Done };

  /// Description of the next node the driver must supply.
  struct NextRead {
    Step step{Step::Header};
    uint64_t encodedOffset{0}; ///< Node position in a combined/outboard stream
    uint64_t contentStart{0};  ///< First content byte covered by the node
    uint64_t size{0};          ///< Bytes to read: 8, 64 or the chunk length
  };

  VerifyState(const Hash &root, std::shared_ptr<const Compressor> compressor,
              EncodingMode mode = EncodingMode::Combined);

  /**
   * @brief Next node to read. Frames ending before the target are dropped
   * here without being read or hashed.
   */
  NextRead next();

  /**
   * @brief Accept the length header.
   * @throw LengthOverflowError if the length cannot be encoded.
   */
  void feed_header(const LengthHeader &header);

  /**
   * @brief Verify a parent node and descend into it.
   * @throw HashMismatchError on mismatch.
   */
  void feed_parent(const ParentNode &node);

  /**
   * @brief Verify a chunk. On success the chunk is authenticated and the
   * driver may hand its bytes to the caller.
   * @throw HashMismatchError on mismatch.
   */
  void feed_chunk(std::span<const uint8_t> chunk);

  /**
   * @brief Aim at content offset @p target.
   *
   * Targets at or past the declared end aim at the final chunk. A target
   * before the unread nodes restarts from the root frame.
   */
  void seek_to(uint64_t target);

  /// Record an error raised by the driver; every later call rethrows it.
  void mark_failed(ErrorKind kind);

  /// @throw TreeError of the recorded kind if the session failed earlier.
  void check_usable() const;

  bool header_read() const { return headerRead_; }
  bool length_verified() const { return lengthVerified_; }

  /**
   * @brief Length from the header, possibly forged. Must not be reported
   * to callers before length_verified() is true.
   */
  uint64_t declared_length() const { return declaredLen_; }

  /// Frames currently pending (bounded by the tree height plus one).
  size_t depth() const { return stack_.size(); }

private:
  struct Frame {
    Hash expected{};
    uint64_t start{0};
    uint64_t len{0};
    uint64_t encodedOffset{0};
    bool isRoot{false};
  };

  void resetToRoot();
  uint64_t effectiveTarget() const;
  const Frame &top() const;

  Hash root_;
  std::shared_ptr<const Compressor> compressor_;
  EncodingMode mode_;
  std::vector<Frame> stack_;
  uint64_t declaredLen_{0};
  uint64_t target_{0};
  bool headerRead_{false};
  bool lengthVerified_{false};
  std::optional<ErrorKind> failed_;
};

} // namespace veritree

#endif // VERITREE_VERIFY_STATE_HPP
