#ifndef VERITREE_COMPRESSOR_HPP
#define VERITREE_COMPRESSOR_HPP

#include "veritree/digest.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace veritree {

/// Role of a node in the tree, part of the domain separation.
enum class NodeLevel : uint8_t { Leaf = 0, Interior = 1 };

/**
 * @brief Parameters fed to the primitive alongside the node bytes.
 *
 * Distinct parameter sets select unrelated functions, so a chunk can never
 * be confused with a parent and a root never with an inner node.
 */
struct NodeParams {
  NodeLevel level{NodeLevel::Leaf};
  uint32_t counter{0}; ///< Chunk index mod 2^32; always 0 for parents
  bool finalize{false}; ///< Set only on the topmost node
};

/// One input of a batched compress_many() call.
struct CompressJob {
  std::span<const uint8_t> block;
  NodeParams params;
};

/**
 * @brief Fixed-output compression primitive used for every node.
 *
 * Implementations are pure functions of their inputs: stateless, reentrant
 * and safe to share between threads.
 */
class Compressor {
public:
  virtual ~Compressor() = default;

  virtual HashAlgorithm algorithm() const = 0;

  /**
   * @brief Hash one node.
   * @param block Chunk bytes (at most CHUNK_SIZE) or a 64-byte parent value.
   * @param params Level, counter and finalize flag of the node.
   */
  virtual Hash compress(std::span<const uint8_t> block,
                        const NodeParams &params) const = 0;

  /**
   * @brief Hash several independent nodes in one call.
   *
   * Results are identical to calling compress() on each job; the batch width
   * only affects throughput. @p out must hold at least jobs.size() entries.
   */
  virtual void compress_many(std::span<const CompressJob> jobs,
                             std::span<Hash> out) const;
};

/**
 * @brief BLAKE2b-256 through libsodium.
 *
 * The counter goes into the salt, level and finalize flag into the
 * personalization block.
 */
class Blake2bCompressor : public Compressor {
public:
  /** @throw std::runtime_error if libsodium cannot be initialized. */
  Blake2bCompressor();

  HashAlgorithm algorithm() const override { return HashAlgorithm::BLAKE2B; }
  Hash compress(std::span<const uint8_t> block,
                const NodeParams &params) const override;
};

/**
 * @brief Keyed BLAKE3, the key encoding the node parameters.
 */
class Blake3Compressor : public Compressor {
public:
  HashAlgorithm algorithm() const override { return HashAlgorithm::BLAKE3; }
  Hash compress(std::span<const uint8_t> block,
                const NodeParams &params) const override;
  void compress_many(std::span<const CompressJob> jobs,
                     std::span<Hash> out) const override;
};

/// Shared, immutable instance of the requested backend.
std::shared_ptr<const Compressor> make_compressor(HashAlgorithm algo);

/**
 * @brief Known-answer test of the primitive libraries.
 *
 * Hashes fixed messages with libsodium BLAKE2b and BLAKE3 and compares the
 * output with hard coded digests.
 *
 * @return true if every digest matches.
 */
bool primitive_self_test();

} // namespace veritree

#endif // VERITREE_COMPRESSOR_HPP
