#ifndef VERITREE_CONFIG_HPP
#define VERITREE_CONFIG_HPP

#include "veritree/digest.hpp"
#include "veritree/logger.h"
#include "veritree/slice.hpp"
#include "veritree/tree_hasher.hpp"
#include <string>

namespace veritree {

/**
 * @brief Runtime settings of the veritree tools.
 *
 * Defaults apply to anything missing from the configuration file.
 */
struct RuntimeOptions {
  HashAlgorithm hashAlgorithm = HashAlgorithm::BLAKE2B;
  HashOptions hashing;
  SliceOptions slicing;
  std::string logFile = Logger::CONSOLE_ONLY_OUTPUT;
  LogLevel logLevel = LogLevel::WARN;
};

/**
 * @brief Load options from a YAML file.
 *
 * A missing or unparsable file leaves the defaults in place; an invalid value
 * for a single key is reported and ignored.
 *
 * @param path YAML file.
 * @return Options with the file applied.
 */
RuntimeOptions loadRuntimeOptions(const std::string &path);

/**
 * @brief Load options from $VERITREE_CONFIG (or "veritree.yaml") and apply
 * the VERITREE_HASH_ALGORITHM, VERITREE_WORKERS and VERITREE_LOG_LEVEL
 * environment overrides.
 */
RuntimeOptions loadRuntimeOptions();

} // namespace veritree

#endif // VERITREE_CONFIG_HPP
