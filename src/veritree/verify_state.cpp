#include "veritree/verify_state.hpp"
#include "veritree/logger.h"
#include <algorithm>
#include <stdexcept>

namespace veritree {

VerifyState::VerifyState(const Hash &root,
                         std::shared_ptr<const Compressor> compressor,
                         EncodingMode mode)
    : root_(root), compressor_(std::move(compressor)), mode_(mode) {
  if (!compressor_) {
    throw std::invalid_argument("VerifyState requires a compressor");
  }
  stack_.reserve(MAX_DEPTH + 1);
}

void VerifyState::check_usable() const {
  if (failed_) {
    throw TreeError(*failed_, "Verification session aborted after an earlier " +
                                  errorKindToString(*failed_) + " failure");
  }
}

void VerifyState::mark_failed(ErrorKind kind) {
  if (!failed_) {
    failed_ = kind;
  }
}

const VerifyState::Frame &VerifyState::top() const {
  if (stack_.empty()) {
    throw std::logic_error("VerifyState: no pending node");
  }
  return stack_.back();
}

void VerifyState::resetToRoot() {
  stack_.clear();
  Frame root;
  root.expected = root_;
  root.start = 0;
  root.len = declaredLen_;
  root.encodedOffset = HEADER_SIZE;
  root.isRoot = true;
  stack_.push_back(root);
}

uint64_t VerifyState::effectiveTarget() const {
  if (declaredLen_ == 0) {
    return 0;
  }
  return std::min(target_, declaredLen_ - 1);
}

VerifyState::NextRead VerifyState::next() {
  check_usable();
  NextRead nr;
  if (!headerRead_) {
    nr.step = Step::Header;
    nr.encodedOffset = 0;
    nr.size = HEADER_SIZE;
    return nr;
  }

  const uint64_t t = effectiveTarget();
  // Skip subtrees entirely before the target. The empty chunk has no
  // extent and is never skipped.
  while (!stack_.empty() && stack_.back().len > 0 &&
         stack_.back().start + stack_.back().len <= t) {
    stack_.pop_back();
  }
  if (stack_.empty()) {
    nr.step = Step::Done;
    return nr;
  }

  const Frame &f = stack_.back();
  nr.encodedOffset = f.encodedOffset;
  nr.contentStart = f.start;
  if (layout::is_chunk(f.len)) {
    nr.step = Step::Chunk;
    nr.size = f.len;
  } else {
    nr.step = Step::Parent;
    nr.size = PARENT_SIZE;
  }
  return nr;
}

void VerifyState::feed_header(const LengthHeader &header) {
  check_usable();
  if (headerRead_) {
    throw std::logic_error("VerifyState: header already consumed");
  }
  const uint64_t len = layout::decode_len(header);
  if (mode_ == EncodingMode::Combined && !layout::is_encodable(len)) {
    mark_failed(ErrorKind::LengthOverflow);
    ThrowLengthOverflow(len);
  }
  declaredLen_ = len;
  headerRead_ = true;
  resetToRoot();
}

void VerifyState::feed_parent(const ParentNode &node) {
  check_usable();
  const Frame f = top();
  if (layout::is_chunk(f.len)) {
    throw std::logic_error("VerifyState: expected a chunk, got a parent");
  }
  Hash computed = parent_hash(*compressor_, node, f.isRoot);
  if (!hashes_equal(computed, f.expected)) {
    mark_failed(ErrorKind::HashMismatch);
    ThrowHashMismatch("parent [" + std::to_string(f.start) + ", " +
                          std::to_string(f.start + f.len) + ")",
                      f.start);
  }
  stack_.pop_back();

  const uint64_t leftLen = layout::left_len(f.len);
  Frame left;
  left.expected = left_half(node);
  left.start = f.start;
  left.len = leftLen;
  left.encodedOffset = f.encodedOffset + PARENT_SIZE;

  Frame right;
  right.expected = right_half(node);
  right.start = f.start + leftLen;
  right.len = f.len - leftLen;
  right.encodedOffset =
      left.encodedOffset + layout::encoded_subtree_size(leftLen, mode_);

  stack_.push_back(right);
  stack_.push_back(left);
}

void VerifyState::feed_chunk(std::span<const uint8_t> chunk) {
  check_usable();
  const Frame f = top();
  if (!layout::is_chunk(f.len) || chunk.size() != f.len) {
    throw std::logic_error("VerifyState: chunk does not match pending node");
  }
  Hash computed = chunk_hash(*compressor_, chunk, layout::chunk_index(f.start),
                             f.isRoot);
  if (!hashes_equal(computed, f.expected)) {
    mark_failed(ErrorKind::HashMismatch);
    ThrowHashMismatch("chunk " + std::to_string(layout::chunk_index(f.start)),
                      f.start);
  }
  stack_.pop_back();
  if (f.start + f.len == declaredLen_ && !lengthVerified_) {
    lengthVerified_ = true;
    Logger::getInstance().log(LogLevel::TRACE,
                              "Final chunk verified, content length " +
                                  std::to_string(declaredLen_));
  }
}

void VerifyState::seek_to(uint64_t target) {
  check_usable();
  target_ = target;
  if (!headerRead_) {
    return;
  }
  const uint64_t t = effectiveTarget();
  bool restart = stack_.empty() ? target < declaredLen_ : top().start > t;
  if (restart) {
    resetToRoot();
  }
}

} // namespace veritree
