#ifndef VERITREE_ERRORS_HPP
#define VERITREE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace veritree {

/// Failure categories raised by hashing, decoding and slicing.
enum class ErrorKind {
  HashMismatch,
  TruncatedInput,
  LengthOverflow,
  BoundsError,
  IoError
};

std::string errorKindToString(ErrorKind kind);

/**
 * @brief Base class of every error thrown by veritree.
 *
 * A session (decoder, slice decoder, hash) that raised a TreeError must be
 * discarded. Bytes it returned earlier are not authenticated.
 */
class TreeError : public std::runtime_error {
public:
  TreeError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

/** Recomputed node hash disagrees with the expected one. */
class HashMismatchError : public TreeError {
public:
  HashMismatchError(const std::string &message, uint64_t contentOffset)
      : TreeError(ErrorKind::HashMismatch, message),
        contentOffset_(contentOffset) {}

  /// Content offset of the first byte covered by the failing node.
  uint64_t contentOffset() const { return contentOffset_; }

private:
  uint64_t contentOffset_;
};

/** Fewer bytes were available than the current node requires. */
class TruncatedInputError : public TreeError {
public:
  explicit TruncatedInputError(const std::string &message)
      : TreeError(ErrorKind::TruncatedInput, message) {}
};

/** The length header cannot be represented by a supported tree. */
class LengthOverflowError : public TreeError {
public:
  explicit LengthOverflowError(const std::string &message)
      : TreeError(ErrorKind::LengthOverflow, message) {}
};

/** A slice request lies outside the content under the strict policy. */
class BoundsError : public TreeError {
public:
  explicit BoundsError(const std::string &message)
      : TreeError(ErrorKind::BoundsError, message) {}
};

/** Storage layer failure (open, seek, write). */
class IoError : public TreeError {
public:
  explicit IoError(const std::string &message)
      : TreeError(ErrorKind::IoError, message) {}
};

// Helpers that log the failure at ERROR level before throwing.
[[noreturn]] void ThrowHashMismatch(const std::string &node,
                                    uint64_t contentOffset);
[[noreturn]] void ThrowTruncatedInput(uint64_t wanted, uint64_t got);
[[noreturn]] void ThrowLengthOverflow(uint64_t declaredLength);
[[noreturn]] void ThrowBoundsError(uint64_t start, uint64_t count,
                                   uint64_t contentLength);
[[noreturn]] void ThrowIoError(const std::string &what);

} // namespace veritree

#endif // VERITREE_ERRORS_HPP
