#include "test_data.hpp"
#include "veritree/digest.hpp"
#include "veritree/errors.hpp"
#include "veritree/io.hpp"
#include "veritree/tree_hasher.hpp"
#include "veritree/tree_layout.hpp"
#include <algorithm>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace veritree;

namespace {

std::string rootHex(const std::vector<uint8_t> &data,
                    HashOptions options = {}) {
  TreeHasher hasher(blake2b(), options);
  return hash_to_hex(hasher.hash(data));
}

// Delegates to BLAKE2b but fails on one chosen chunk.
class FailingCompressor : public Compressor {
public:
  explicit FailingCompressor(uint32_t failAt) : failAt_(failAt) {}

  HashAlgorithm algorithm() const override { return HashAlgorithm::BLAKE2B; }
  Hash compress(std::span<const uint8_t> block,
                const NodeParams &params) const override {
    if (params.level == NodeLevel::Leaf && params.counter == failAt_) {
      throw IoError("chunk " + std::to_string(failAt_) + " unreadable");
    }
    return inner_.compress(block, params);
  }

private:
  Blake2bCompressor inner_;
  uint32_t failAt_;
};

} // namespace

TEST(TreeHasher, PinnedRootOfZeroInput) {
  std::vector<uint8_t> zeros(8193, 0);
  EXPECT_EQ(rootHex(zeros),
            "d5281bcea79852f5fa2b8a486c159d8f1b0d00e0e9762b3564c1ee0b775a4231");
}

TEST(TreeHasher, PinnedRootsOfPatternInput) {
  const std::vector<std::pair<size_t, std::string>> cases = {
      {0, "7a3929c12a8c586703a88c887e73ec87946ac6dcbed2f25ad5b27ed1f44d5390"},
      {1, "80f3a8890a1f4c622add4f623fa55644d59747cc152b917e4bb77a4606a956df"},
      {1024,
       "4e8406690dd4c45eecff05688d66b709925d157487bafb72290ecd4f98648357"},
      {4096,
       "b25e8a3900838d64304c52a52277151600dbfad58fe4980c773870e3913aac37"},
      {4097,
       "e8fbaa1a5e202649256832eef4f99ea11ed1997657b1e5ecfb905523e3dfedfc"},
      {12288,
       "c736c18b3d9e5a2e187dc030ee3cd5621c3b8fc2f9dee3c9bc7b2f3bdc26f721"},
      {65537,
       "1faf1492d82ce870fdaee5396ebcbbb1328ef01ecb96f54a59ee313ad955d215"},
  };
  for (const auto &[size, expected] : cases) {
    EXPECT_EQ(rootHex(patternBytes(size)), expected) << "size " << size;
  }
}

TEST(TreeHasher, ParallelAndBatchedMatchSequential) {
  std::vector<uint8_t> data = patternBytes(1024 * 1024 + 123);

  HashOptions sequential;
  sequential.workers = 1;
  sequential.batch_width = 1;
  const std::string expected = rootHex(data, sequential);

  for (size_t workers : {1u, 2u, 4u, 8u}) {
    for (size_t batch : {1u, 3u, 8u, 16u}) {
      HashOptions options;
      options.workers = workers;
      options.batch_width = batch;
      options.fork_threshold = 2 * CHUNK_SIZE;
      EXPECT_EQ(rootHex(data, options), expected)
          << "workers " << workers << " batch " << batch;
    }
  }
}

TEST(TreeHasher, SharedHasherAcrossCalls) {
  HashOptions options;
  options.workers = 4;
  options.fork_threshold = 16 * 1024;
  TreeHasher hasher(blake2b(), options);
  std::vector<uint8_t> a = patternBytes(300 * 1024);
  std::vector<uint8_t> b = patternBytes(300 * 1024 + 1);
  Hash first = hasher.hash(a);
  EXPECT_NE(hasher.hash(b), first);
  EXPECT_EQ(hasher.hash(a), first);
}

TEST(TreeHasher, OptionsAreNormalized) {
  HashOptions options;
  options.batch_width = 0;
  options.fork_threshold = 1;
  TreeHasher hasher(blake2b(), options);
  EXPECT_EQ(hasher.options().batch_width, 1u);
  EXPECT_EQ(hasher.options().fork_threshold, 2 * CHUNK_SIZE);
  EXPECT_THROW(TreeHasher(nullptr), std::invalid_argument);
}

TEST(TreeHasher, Blake3IsDeterministicAndParallelSafe) {
  auto c = make_compressor(HashAlgorithm::BLAKE3);
  std::vector<uint8_t> data = patternBytes(200 * 1024 + 7);
  HashOptions parallel;
  parallel.workers = 4;
  parallel.fork_threshold = 2 * CHUNK_SIZE;
  Hash seq = TreeHasher(c).hash(data);
  EXPECT_EQ(TreeHasher(c, parallel).hash(data), seq);
  EXPECT_NE(seq, TreeHasher(blake2b()).hash(data));
}

TEST(StreamingHasher, MatchesInMemoryForAnySplit) {
  for (size_t size : {0u, 1u, 4096u, 4097u, 8192u, 8193u, 12288u, 12289u,
                      16384u, 65537u}) {
    std::vector<uint8_t> data = patternBytes(size);
    Hash expected = TreeHasher(blake2b()).hash(data);
    for (size_t step : {1u, 1000u, 4096u, 5000u}) {
      if (size > 20000 && step == 1) {
        continue;
      }
      Hasher hasher(blake2b());
      for (size_t off = 0; off < size; off += step) {
        size_t n = std::min(step, size - off);
        hasher.update(std::span<const uint8_t>(data).subspan(off, n));
      }
      EXPECT_EQ(hasher.count(), size);
      EXPECT_EQ(hasher.finalize(), expected)
          << "size " << size << " step " << step;
    }
  }
}

TEST(StreamingHasher, FinalizeTwiceThrows) {
  Hasher hasher(blake2b());
  hasher.update(patternBytes(10));
  hasher.finalize();
  EXPECT_THROW(hasher.finalize(), std::logic_error);
  std::vector<uint8_t> more(1, 0);
  EXPECT_THROW(hasher.update(more), std::logic_error);
}

TEST(StreamingHasher, HashReader) {
  std::vector<uint8_t> data = patternBytes(200 * 1024 + 5);
  MemoryReader reader(data);
  EXPECT_EQ(hash_reader(reader, blake2b()), TreeHasher(blake2b()).hash(data));
}

TEST(TreeHasher, FirstErrorPropagatesFromAnySubtree) {
  std::vector<uint8_t> data = patternBytes(1024 * 1024);
  // Chunk 0 is hashed by the calling thread, the others mostly by forks.
  for (uint32_t failAt : {0u, 100u, 200u, 255u}) {
    for (size_t workers : {2u, 4u, 8u}) {
      for (size_t batch : {1u, 5u}) {
        HashOptions options;
        options.workers = workers;
        options.batch_width = batch;
        options.fork_threshold = 2 * CHUNK_SIZE;
        TreeHasher hasher(std::make_shared<FailingCompressor>(failAt), options);
        EXPECT_THROW(hasher.hash(data), IoError)
            << "chunk " << failAt << " workers " << workers << " batch "
            << batch;
      }
    }
  }
}

TEST(TreeHasher, UsableAfterFailedHash) {
  HashOptions options;
  options.workers = 4;
  options.fork_threshold = 2 * CHUNK_SIZE;
  TreeHasher failing(std::make_shared<FailingCompressor>(7), options);
  std::vector<uint8_t> data = patternBytes(256 * 1024);
  EXPECT_THROW(failing.hash(data), IoError);
  // Inputs that never reach chunk 7 still hash normally on the same pool.
  std::vector<uint8_t> small = patternBytes(5 * CHUNK_SIZE);
  EXPECT_EQ(failing.hash(small), TreeHasher(blake2b()).hash(small));
}
