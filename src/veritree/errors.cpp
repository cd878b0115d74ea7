#include "veritree/errors.hpp"
#include "veritree/logger.h"
#include <iostream>
#include <string>

// Logging is best effort: a logger failure must not replace the error that
// is about to be thrown.

namespace veritree {

namespace {

void logError(const std::string &msg) {
  try {
    Logger::getInstance().log(LogLevel::ERROR, msg);
  } catch (const std::runtime_error &e) {
    std::cerr << "Logger not initialized. Original error: " << msg
              << " Logger error: " << e.what() << std::endl;
  }
}

} // namespace

std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::HashMismatch:
    return "HashMismatch";
  case ErrorKind::TruncatedInput:
    return "TruncatedInput";
  case ErrorKind::LengthOverflow:
    return "LengthOverflow";
  case ErrorKind::BoundsError:
    return "BoundsError";
  case ErrorKind::IoError:
    return "IoError";
  default:
    return "Unknown";
  }
}

void ThrowHashMismatch(const std::string &node, uint64_t contentOffset) {
  std::string msg = "Hash mismatch. Node: " + node +
                    " (content offset: " + std::to_string(contentOffset) + ")";
  logError(msg);
  throw HashMismatchError(msg, contentOffset);
}

void ThrowTruncatedInput(uint64_t wanted, uint64_t got) {
  std::string msg = "Truncated input. Wanted " + std::to_string(wanted) +
                    " bytes, got " + std::to_string(got);
  logError(msg);
  throw TruncatedInputError(msg);
}

void ThrowLengthOverflow(uint64_t declaredLength) {
  std::string msg = "Length overflow. Declared content length " +
                    std::to_string(declaredLength) +
                    " exceeds the supported encoding size";
  logError(msg);
  throw LengthOverflowError(msg);
}

void ThrowBoundsError(uint64_t start, uint64_t count, uint64_t contentLength) {
  std::string msg = "Slice out of bounds. Start: " + std::to_string(start) +
                    ", count: " + std::to_string(count) +
                    ", content length: " + std::to_string(contentLength);
  logError(msg);
  throw BoundsError(msg);
}

void ThrowIoError(const std::string &what) {
  std::string msg = "I/O error: " + what;
  logError(msg);
  throw IoError(msg);
}

} // namespace veritree
