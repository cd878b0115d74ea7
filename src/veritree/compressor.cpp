#include "veritree/compressor.hpp"

#include <blake3.h>
#include <cstring>
#include <sodium.h>
#include <stdexcept>

namespace veritree {

namespace {

// ASCII "veritree", the fixed prefix of every parameter block.
constexpr uint8_t kDomainTag[8] = {'v', 'e', 'r', 'i', 't', 'r', 'e', 'e'};

void store_le32(uint8_t *dst, uint32_t value) {
  for (size_t i = 0; i < 4; ++i) {
    dst[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

} // namespace

void Compressor::compress_many(std::span<const CompressJob> jobs,
                               std::span<Hash> out) const {
  if (out.size() < jobs.size()) {
    throw std::invalid_argument("compress_many: output span too small");
  }
  for (size_t i = 0; i < jobs.size(); ++i) {
    out[i] = compress(jobs[i].block, jobs[i].params);
  }
}

Blake2bCompressor::Blake2bCompressor() {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

Hash Blake2bCompressor::compress(std::span<const uint8_t> block,
                                 const NodeParams &params) const {
  static_assert(crypto_generichash_blake2b_SALTBYTES == 16);
  static_assert(crypto_generichash_blake2b_PERSONALBYTES == 16);

  unsigned char salt[crypto_generichash_blake2b_SALTBYTES] = {0};
  store_le32(salt, params.counter);

  unsigned char personal[crypto_generichash_blake2b_PERSONALBYTES] = {0};
  std::memcpy(personal, kDomainTag, sizeof(kDomainTag));
  personal[8] = static_cast<uint8_t>(params.level);
  personal[9] = params.finalize ? 1 : 0;

  Hash out{};
  if (crypto_generichash_blake2b_salt_personal(
          out.data(), out.size(), block.data(), block.size(), nullptr, 0, salt,
          personal) != 0) {
    throw std::runtime_error("crypto_generichash_blake2b_salt_personal failed");
  }
  return out;
}

Hash Blake3Compressor::compress(std::span<const uint8_t> block,
                                const NodeParams &params) const {
  uint8_t key[BLAKE3_KEY_LEN] = {0};
  std::memcpy(key, kDomainTag, sizeof(kDomainTag));
  key[8] = static_cast<uint8_t>(params.level);
  key[9] = params.finalize ? 1 : 0;
  store_le32(key + 10, params.counter);

  blake3_hasher hasher;
  blake3_hasher_init_keyed(&hasher, key);
  blake3_hasher_update(&hasher, block.data(), block.size());
  Hash out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return out;
}

void Blake3Compressor::compress_many(std::span<const CompressJob> jobs,
                                     std::span<Hash> out) const {
  if (out.size() < jobs.size()) {
    throw std::invalid_argument("compress_many: output span too small");
  }
  // Sibling chunks differ only in the counter, so one hasher state is
  // reset with a fresh key per job instead of reallocating.
  uint8_t key[BLAKE3_KEY_LEN] = {0};
  std::memcpy(key, kDomainTag, sizeof(kDomainTag));
  blake3_hasher hasher;
  for (size_t i = 0; i < jobs.size(); ++i) {
    const NodeParams &params = jobs[i].params;
    key[8] = static_cast<uint8_t>(params.level);
    key[9] = params.finalize ? 1 : 0;
    store_le32(key + 10, params.counter);
    blake3_hasher_init_keyed(&hasher, key);
    blake3_hasher_update(&hasher, jobs[i].block.data(), jobs[i].block.size());
    blake3_hasher_finalize(&hasher, out[i].data(), out[i].size());
  }
}

std::shared_ptr<const Compressor> make_compressor(HashAlgorithm algo) {
  if (algo == HashAlgorithm::BLAKE3) {
    return std::make_shared<Blake3Compressor>();
  }
  return std::make_shared<Blake2bCompressor>();
}

bool primitive_self_test() {
  if (sodium_init() < 0) {
    return false;
  }
  // BLAKE2b-256 of the empty string.
  const unsigned char expected_blake2b[crypto_generichash_BYTES] = {
      0x0e, 0x57, 0x51, 0xc0, 0x26, 0xe5, 0x43, 0xb2, 0xe8, 0xab, 0x2e,
      0xb0, 0x60, 0x99, 0xda, 0xa1, 0xd1, 0xe5, 0xdf, 0x47, 0x77, 0x8f,
      0x77, 0x87, 0xfa, 0xab, 0x45, 0xcd, 0xf1, 0x2f, 0xe3, 0xa8};
  unsigned char blake2b_digest[crypto_generichash_BYTES];
  if (crypto_generichash(blake2b_digest, sizeof(blake2b_digest), nullptr, 0,
                         nullptr, 0) != 0) {
    return false;
  }
  if (std::memcmp(blake2b_digest, expected_blake2b, sizeof(blake2b_digest)) !=
      0) {
    return false;
  }

  const char msg[] = "The quick brown fox jumps over the lazy dog";
  unsigned char blake3_digest[BLAKE3_OUT_LEN];
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, reinterpret_cast<const uint8_t *>(msg),
                       sizeof(msg) - 1);
  blake3_hasher_finalize(&hasher, blake3_digest, BLAKE3_OUT_LEN);
  const unsigned char expected_blake3[BLAKE3_OUT_LEN] = {
      0x2f, 0x15, 0x14, 0x18, 0x1a, 0xad, 0xcc, 0xd9, 0x13, 0xab, 0xd9,
      0x4c, 0xfa, 0x59, 0x27, 0x01, 0xa5, 0x68, 0x6a, 0xb2, 0x3f, 0x8d,
      0xf1, 0xdf, 0xf1, 0xb7, 0x47, 0x10, 0xfe, 0xbc, 0x6d, 0x4a};
  return std::memcmp(blake3_digest, expected_blake3, BLAKE3_OUT_LEN) == 0;
}

} // namespace veritree
