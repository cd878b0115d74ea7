#include "veritree/digest.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace veritree {

namespace {

constexpr char kHexChars[] = "0123456789abcdef";

// 0xFF on invalid character.
uint8_t hex_nibble(char c) {
  if (c >= '0' && c <= '9')
    return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f')
    return static_cast<uint8_t>(c - 'a' + 10);
  if (c >= 'A' && c <= 'F')
    return static_cast<uint8_t>(c - 'A' + 10);
  return 0xFF;
}

} // namespace

std::string hash_to_hex(const Hash &hash) {
  std::string out(DIGEST_SIZE * 2, '0');
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    out[i * 2] = kHexChars[hash[i] >> 4];
    out[i * 2 + 1] = kHexChars[hash[i] & 0x0f];
  }
  return out;
}

Hash hex_to_hash(const std::string &hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    throw std::invalid_argument("Hex digest must be 64 characters long. "
                                "Provided: " +
                                hex);
  }
  Hash hash{};
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    uint8_t hi = hex_nibble(hex[i * 2]);
    uint8_t lo = hex_nibble(hex[i * 2 + 1]);
    if (hi == 0xFF || lo == 0xFF) {
      throw std::invalid_argument("Invalid hex digit in digest: " +
                                  hex.substr(i * 2, 2));
    }
    hash[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return hash;
}

HashAlgorithm algorithm_from_string(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "blake2b")
    return HashAlgorithm::BLAKE2B;
  if (lower == "blake3")
    return HashAlgorithm::BLAKE3;
  throw std::invalid_argument("Unknown hash algorithm: " + name);
}

std::string algorithm_to_string(HashAlgorithm algo) {
  return algo == HashAlgorithm::BLAKE3 ? "blake3" : "blake2b";
}

} // namespace veritree
