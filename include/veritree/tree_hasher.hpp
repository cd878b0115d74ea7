#ifndef VERITREE_TREE_HASHER_HPP
#define VERITREE_TREE_HASHER_HPP

#include "veritree/compressor.hpp"
#include "veritree/fork_join.hpp"
#include "veritree/io.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace veritree {

/// Tuning knobs of TreeHasher. None of them changes the resulting hash.
struct HashOptions {
  size_t workers = 1;                  ///< 1 hashes on the calling thread only
  uint64_t fork_threshold = 64 * 1024; ///< Parents above this size fork
  size_t batch_width = 8;              ///< Sibling chunks per compress_many
};

/**
 * @brief Computes the root hash of an in-memory input.
 *
 * Subtrees larger than HashOptions::fork_threshold are split into a left
 * part hashed by the calling thread and a right part forked to the pool.
 * Subtrees of at most batch_width chunks are hashed with one
 * Compressor::compress_many call.
 */
class TreeHasher {
public:
  explicit TreeHasher(std::shared_ptr<const Compressor> compressor,
                      HashOptions options = {});

  Hash hash(std::span<const uint8_t> input) const;

  const HashOptions &options() const { return options_; }
  const Compressor &compressor() const { return *compressor_; }

private:
  Hash hashSubtree(std::span<const uint8_t> input, uint64_t offset,
                   bool isRoot) const;
  Hash hashBatched(std::span<const uint8_t> input, uint64_t offset,
                   bool isRoot) const;

  std::shared_ptr<const Compressor> compressor_;
  HashOptions options_;
  std::unique_ptr<ForkJoinPool> pool_;
};

/**
 * @brief Incremental hasher for input of unknown length.
 *
 * Holds back the most recent chunk until more input arrives, because only
 * finalize() knows whether that chunk is the root. Completed subtrees are
 * merged eagerly, keeping at most one hash per tree level.
 */
class Hasher {
public:
  explicit Hasher(std::shared_ptr<const Compressor> compressor);

  void update(std::span<const uint8_t> data);

  /**
   * @brief Produce the root hash.
   * @throw std::logic_error if called twice.
   */
  Hash finalize();

  uint64_t count() const { return total_; }

private:
  void addChunkHash(Hash hash, uint64_t totalChunks);

  std::shared_ptr<const Compressor> compressor_;
  std::vector<uint8_t> chunk_;
  std::vector<Hash> stack_;
  uint64_t chunksDone_{0};
  uint64_t total_{0};
  bool finalized_{false};
};

/// Stream @p reader to its end through a Hasher.
Hash hash_reader(Reader &reader, std::shared_ptr<const Compressor> compressor);

} // namespace veritree

#endif // VERITREE_TREE_HASHER_HPP
