#include "veritree/config.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace veritree {

namespace {

BoundsPolicy boundsPolicyFromString(const std::string &name) {
  if (name == "clamp")
    return BoundsPolicy::Clamp;
  if (name == "strict")
    return BoundsPolicy::Strict;
  throw std::invalid_argument("Unknown slice_bounds policy: " + name);
}

ZeroCountPolicy zeroCountPolicyFromString(const std::string &name) {
  if (name == "expand")
    return ZeroCountPolicy::ExpandToOne;
  if (name == "reject")
    return ZeroCountPolicy::Reject;
  throw std::invalid_argument("Unknown slice_zero_count policy: " + name);
}

// Applies one key; a bad value is reported on stderr and skipped because the
// logger itself may still be unconfigured at this point.
template <typename Fn>
void applyKey(const YAML::Node &node, const char *key, Fn &&apply) {
  if (!node[key]) {
    return;
  }
  try {
    apply(node[key]);
  } catch (const std::exception &e) {
    std::cerr << "veritree config: ignoring invalid '" << key
              << "': " << e.what() << std::endl;
  }
}

} // namespace

RuntimeOptions loadRuntimeOptions(const std::string &path) {
  RuntimeOptions opts;
  if (!std::filesystem::exists(path)) {
    return opts;
  }
  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    std::cerr << "veritree config: cannot parse " << path << ": " << e.what()
              << std::endl;
    return opts;
  }

  applyKey(node, "hash_algorithm", [&](const YAML::Node &v) {
    opts.hashAlgorithm = algorithm_from_string(v.as<std::string>());
  });
  applyKey(node, "workers", [&](const YAML::Node &v) {
    opts.hashing.workers = v.as<size_t>();
  });
  applyKey(node, "fork_threshold", [&](const YAML::Node &v) {
    opts.hashing.fork_threshold = v.as<uint64_t>();
  });
  applyKey(node, "batch_width", [&](const YAML::Node &v) {
    opts.hashing.batch_width = v.as<size_t>();
  });
  applyKey(node, "slice_bounds", [&](const YAML::Node &v) {
    opts.slicing.bounds = boundsPolicyFromString(v.as<std::string>());
  });
  applyKey(node, "slice_zero_count", [&](const YAML::Node &v) {
    opts.slicing.zeroCount = zeroCountPolicyFromString(v.as<std::string>());
  });
  applyKey(node, "log_file", [&](const YAML::Node &v) {
    opts.logFile = v.as<std::string>();
  });
  applyKey(node, "log_level", [&](const YAML::Node &v) {
    opts.logLevel = logLevelFromString(v.as<std::string>());
  });
  return opts;
}

RuntimeOptions loadRuntimeOptions() {
  const char *cfg = std::getenv("VERITREE_CONFIG");
  if (!cfg)
    cfg = "veritree.yaml";
  RuntimeOptions opts = loadRuntimeOptions(std::string(cfg));

  try {
    if (const char *env = std::getenv("VERITREE_HASH_ALGORITHM"))
      opts.hashAlgorithm = algorithm_from_string(env);
    if (const char *env = std::getenv("VERITREE_WORKERS"))
      opts.hashing.workers = static_cast<size_t>(std::stoul(env));
    if (const char *env = std::getenv("VERITREE_LOG_LEVEL"))
      opts.logLevel = logLevelFromString(env);
  } catch (const std::exception &e) {
    std::cerr << "veritree config: ignoring invalid environment override: "
              << e.what() << std::endl;
  }
  return opts;
}

} // namespace veritree
