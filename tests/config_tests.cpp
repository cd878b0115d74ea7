#include "veritree/config.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

using namespace veritree;

namespace {

std::string writeConfig(const std::string &name, const std::string &yaml) {
  std::string path = (std::filesystem::temp_directory_path() / name).string();
  std::ofstream out(path, std::ios::trunc);
  out << yaml;
  return path;
}

} // namespace

TEST(RuntimeOptions, DefaultsWhenFileMissing) {
  RuntimeOptions opts = loadRuntimeOptions("/nonexistent/veritree.yaml");
  EXPECT_EQ(opts.hashAlgorithm, HashAlgorithm::BLAKE2B);
  EXPECT_EQ(opts.hashing.workers, 1u);
  EXPECT_EQ(opts.hashing.batch_width, 8u);
  EXPECT_EQ(opts.slicing.bounds, BoundsPolicy::Clamp);
  EXPECT_EQ(opts.slicing.zeroCount, ZeroCountPolicy::ExpandToOne);
  EXPECT_EQ(opts.logFile, Logger::CONSOLE_ONLY_OUTPUT);
  EXPECT_EQ(opts.logLevel, LogLevel::WARN);
}

TEST(RuntimeOptions, LoadsEveryKey) {
  std::string path = writeConfig("veritree_config_full.yaml",
                                 "hash_algorithm: blake3\n"
                                 "workers: 6\n"
                                 "fork_threshold: 131072\n"
                                 "batch_width: 16\n"
                                 "slice_bounds: strict\n"
                                 "slice_zero_count: reject\n"
                                 "log_file: /tmp/veritree.log\n"
                                 "log_level: debug\n");
  RuntimeOptions opts = loadRuntimeOptions(path);
  EXPECT_EQ(opts.hashAlgorithm, HashAlgorithm::BLAKE3);
  EXPECT_EQ(opts.hashing.workers, 6u);
  EXPECT_EQ(opts.hashing.fork_threshold, 131072u);
  EXPECT_EQ(opts.hashing.batch_width, 16u);
  EXPECT_EQ(opts.slicing.bounds, BoundsPolicy::Strict);
  EXPECT_EQ(opts.slicing.zeroCount, ZeroCountPolicy::Reject);
  EXPECT_EQ(opts.logFile, "/tmp/veritree.log");
  EXPECT_EQ(opts.logLevel, LogLevel::DEBUG);
  std::remove(path.c_str());
}

TEST(RuntimeOptions, InvalidValueKeepsDefault) {
  std::string path = writeConfig("veritree_config_bad.yaml",
                                 "hash_algorithm: md5\n"
                                 "workers: many\n"
                                 "slice_bounds: strict\n");
  RuntimeOptions opts = loadRuntimeOptions(path);
  EXPECT_EQ(opts.hashAlgorithm, HashAlgorithm::BLAKE2B);
  EXPECT_EQ(opts.hashing.workers, 1u);
  EXPECT_EQ(opts.slicing.bounds, BoundsPolicy::Strict);
  std::remove(path.c_str());
}

TEST(RuntimeOptions, UnparsableFileKeepsDefaults) {
  std::string path =
      writeConfig("veritree_config_broken.yaml", "workers: [1, 2\n");
  RuntimeOptions opts = loadRuntimeOptions(path);
  EXPECT_EQ(opts.hashing.workers, 1u);
  std::remove(path.c_str());
}

TEST(RuntimeOptions, EnvironmentOverridesFile) {
  std::string path = writeConfig("veritree_config_env.yaml",
                                 "hash_algorithm: blake2b\n"
                                 "workers: 2\n"
                                 "batch_width: 4\n");
  setenv("VERITREE_CONFIG", path.c_str(), 1);
  setenv("VERITREE_HASH_ALGORITHM", "blake3", 1);
  setenv("VERITREE_WORKERS", "5", 1);
  setenv("VERITREE_LOG_LEVEL", "error", 1);

  RuntimeOptions opts = loadRuntimeOptions();
  EXPECT_EQ(opts.hashAlgorithm, HashAlgorithm::BLAKE3);
  EXPECT_EQ(opts.hashing.workers, 5u);
  EXPECT_EQ(opts.hashing.batch_width, 4u);
  EXPECT_EQ(opts.logLevel, LogLevel::ERROR);

  unsetenv("VERITREE_CONFIG");
  unsetenv("VERITREE_HASH_ALGORITHM");
  unsetenv("VERITREE_WORKERS");
  unsetenv("VERITREE_LOG_LEVEL");
  std::remove(path.c_str());
}
