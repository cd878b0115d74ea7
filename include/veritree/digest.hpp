#ifndef VERITREE_DIGEST_HPP
#define VERITREE_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace veritree {

/// Supported compression primitives.
enum class HashAlgorithm { BLAKE2B, BLAKE3 };

/// Digest size for every node and root hash (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using Hash = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Convert a hash to 64 lowercase hex characters.
 */
std::string hash_to_hex(const Hash &hash);

/**
 * @brief Parse 64 hex characters (either case) into a hash.
 * @throws std::invalid_argument if the string is not a valid digest.
 */
Hash hex_to_hash(const std::string &hex);

/**
 * @brief Parse an algorithm name ("blake2b" or "blake3").
 * @throws std::invalid_argument for unknown names.
 */
HashAlgorithm algorithm_from_string(const std::string &name);

std::string algorithm_to_string(HashAlgorithm algo);

} // namespace veritree

#endif // VERITREE_DIGEST_HPP
