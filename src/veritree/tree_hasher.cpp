#include "veritree/tree_hasher.hpp"
#include "veritree/logger.h"
#include "veritree/node_hasher.hpp"
#include "veritree/tree_layout.hpp"
#include <algorithm>
#include <stdexcept>

namespace veritree {

namespace {

// Parent hashes over precomputed chunk hashes, following the same layout as
// the byte-level recursion.
Hash combineChunkHashes(const Compressor &compressor, const Hash *hashes,
                        uint64_t len, bool isRoot) {
  if (layout::is_chunk(len)) {
    return hashes[0];
  }
  uint64_t left = layout::left_len(len);
  Hash l = combineChunkHashes(compressor, hashes, left, false);
  Hash r = combineChunkHashes(compressor, hashes + left / CHUNK_SIZE,
                              len - left, false);
  return parent_hash(compressor, l, r, isRoot);
}

} // namespace

TreeHasher::TreeHasher(std::shared_ptr<const Compressor> compressor,
                       HashOptions options)
    : compressor_(std::move(compressor)), options_(options) {
  if (!compressor_) {
    throw std::invalid_argument("TreeHasher requires a compressor");
  }
  if (options_.batch_width == 0) {
    options_.batch_width = 1;
  }
  if (options_.fork_threshold < 2 * CHUNK_SIZE) {
    options_.fork_threshold = 2 * CHUNK_SIZE;
  }
  if (options_.workers > 1) {
    pool_ = std::make_unique<ForkJoinPool>(options_.workers);
  }
}

Hash TreeHasher::hash(std::span<const uint8_t> input) const {
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Hashing " + std::to_string(input.size()) +
                                " bytes with " +
                                algorithm_to_string(compressor_->algorithm()));
  return hashSubtree(input, 0, true);
}

Hash TreeHasher::hashSubtree(std::span<const uint8_t> input, uint64_t offset,
                             bool isRoot) const {
  const uint64_t len = input.size();
  if (layout::is_chunk(len)) {
    return chunk_hash(*compressor_, input, layout::chunk_index(offset), isRoot);
  }
  if (options_.batch_width > 1 &&
      layout::count_chunks(len) <= options_.batch_width) {
    return hashBatched(input, offset, isRoot);
  }

  const uint64_t leftLen = layout::left_len(len);
  auto leftInput = input.first(leftLen);
  auto rightInput = input.subspan(leftLen);

  Hash left{};
  Hash right{};
  if (pool_ && len > options_.fork_threshold) {
    auto task = pool_->submit([&] {
      right = hashSubtree(rightInput, offset + leftLen, false);
    });
    try {
      left = hashSubtree(leftInput, offset, false);
    } catch (...) {
      pool_->cancel(task);
      throw;
    }
    pool_->join(task);
  } else {
    left = hashSubtree(leftInput, offset, false);
    right = hashSubtree(rightInput, offset + leftLen, false);
  }
  return parent_hash(*compressor_, left, right, isRoot);
}

Hash TreeHasher::hashBatched(std::span<const uint8_t> input, uint64_t offset,
                             bool isRoot) const {
  const uint64_t len = input.size();
  const size_t chunks = static_cast<size_t>(layout::count_chunks(len));
  std::vector<CompressJob> jobs(chunks);
  for (size_t i = 0; i < chunks; ++i) {
    uint64_t start = i * CHUNK_SIZE;
    uint64_t size = std::min<uint64_t>(CHUNK_SIZE, len - start);
    jobs[i].block = input.subspan(start, size);
    // Never the root: a batch always holds more than one chunk.
    jobs[i].params = chunk_params(layout::chunk_index(offset) + i, false);
  }
  std::vector<Hash> hashes(chunks);
  compressor_->compress_many(jobs, hashes);
  return combineChunkHashes(*compressor_, hashes.data(), len, isRoot);
}

Hasher::Hasher(std::shared_ptr<const Compressor> compressor)
    : compressor_(std::move(compressor)) {
  if (!compressor_) {
    throw std::invalid_argument("Hasher requires a compressor");
  }
  chunk_.reserve(CHUNK_SIZE);
  stack_.reserve(MAX_DEPTH);
}

void Hasher::update(std::span<const uint8_t> data) {
  if (finalized_) {
    throw std::logic_error("Cannot update after finalize() has been called.");
  }
  while (!data.empty()) {
    if (chunk_.size() == CHUNK_SIZE) {
      // More input follows, so the held chunk is not the root.
      Hash h = chunk_hash(*compressor_, chunk_, chunksDone_, false);
      ++chunksDone_;
      addChunkHash(h, chunksDone_);
      chunk_.clear();
    }
    size_t take = std::min<size_t>(CHUNK_SIZE - chunk_.size(), data.size());
    chunk_.insert(chunk_.end(), data.begin(), data.begin() + take);
    data = data.subspan(take);
    total_ += take;
  }
}

// Each trailing zero bit of the chunk count closes one complete subtree.
void Hasher::addChunkHash(Hash hash, uint64_t totalChunks) {
  while ((totalChunks & 1) == 0) {
    hash = parent_hash(*compressor_, stack_.back(), hash, false);
    stack_.pop_back();
    totalChunks >>= 1;
  }
  stack_.push_back(hash);
}

Hash Hasher::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }
  finalized_ = true;
  if (stack_.empty()) {
    return chunk_hash(*compressor_, chunk_, chunksDone_, true);
  }
  Hash hash = chunk_hash(*compressor_, chunk_, chunksDone_, false);
  while (stack_.size() > 1) {
    hash = parent_hash(*compressor_, stack_.back(), hash, false);
    stack_.pop_back();
  }
  return parent_hash(*compressor_, stack_.back(), hash, true);
}

Hash hash_reader(Reader &reader, std::shared_ptr<const Compressor> compressor) {
  Hasher hasher(std::move(compressor));
  std::vector<uint8_t> buffer(64 * 1024);
  while (true) {
    size_t n = reader.read(buffer.data(), buffer.size());
    if (n == 0)
      break;
    hasher.update(std::span<const uint8_t>(buffer.data(), n));
  }
  return hasher.finalize();
}

} // namespace veritree
