#ifndef VERITREE_TEST_DATA_HPP
#define VERITREE_TEST_DATA_HPP

#include "veritree/compressor.hpp"
#include <cstdint>
#include <memory>
#include <vector>

// Deterministic content: byte i is i mod 251, so no two nearby chunks repeat.
inline std::vector<uint8_t> patternBytes(size_t size) {
  std::vector<uint8_t> data(size);
  for (size_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>(i % 251);
  }
  return data;
}

inline std::shared_ptr<const veritree::Compressor> blake2b() {
  return veritree::make_compressor(veritree::HashAlgorithm::BLAKE2B);
}

#endif // VERITREE_TEST_DATA_HPP
