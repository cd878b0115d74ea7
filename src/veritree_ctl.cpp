#include "veritree/config.hpp"
#include "veritree/decoder.hpp"
#include "veritree/encoder.hpp"
#include "veritree/errors.hpp"
#include "veritree/io.hpp"
#include "veritree/logger.h"
#include "veritree/slice.hpp"
#include "veritree/tree_hasher.hpp"
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace veritree;

namespace {

class StdinReader : public Reader {
public:
  size_t read(uint8_t *buf, size_t len) override {
    std::cin.read(reinterpret_cast<char *>(buf),
                  static_cast<std::streamsize>(len));
    return static_cast<size_t>(std::cin.gcount());
  }
};

struct Args {
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
  bool outboardFlag = false;
};

// "--outboard" takes CONTENT for decode/slice and is a bare flag for encode.
Args parseArgs(int argc, char **argv, int first, bool outboardTakesValue) {
  Args args;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--outboard" && !outboardTakesValue) {
      args.outboardFlag = true;
    } else if (arg.rfind("--", 0) == 0) {
      if (i + 1 >= argc) {
        throw std::invalid_argument("missing value for " + arg);
      }
      args.options[arg.substr(2)] = argv[++i];
    } else {
      args.positional.push_back(arg);
    }
  }
  return args;
}

std::optional<std::string> option(const Args &args, const std::string &name) {
  auto it = args.options.find(name);
  if (it == args.options.end())
    return std::nullopt;
  return it->second;
}

void writeAll(Writer &out, const std::vector<uint8_t> &data) {
  if (!data.empty())
    out.write(data.data(), data.size());
}

int usage() {
  std::cout << "Usage: veritree_ctl hash [FILE...]\n"
            << "       veritree_ctl encode IN OUT [--outboard]\n"
            << "       veritree_ctl decode HASH ENCODED OUT [--outboard CONTENT] "
               "[--start N] [--count N]\n"
            << "       veritree_ctl slice ENCODED OUT START COUNT "
               "[--outboard CONTENT]\n"
            << "       veritree_ctl decode-slice HASH SLICE OUT START COUNT\n";
  return 1;
}

int hashCommand(const RuntimeOptions &opts, const Args &args) {
  auto compressor = make_compressor(opts.hashAlgorithm);
  if (args.positional.empty()) {
    StdinReader in;
    std::cout << hash_to_hex(hash_reader(in, compressor)) << "  -"
              << std::endl;
    return 0;
  }
  TreeHasher hasher(compressor, opts.hashing);
  for (const auto &path : args.positional) {
    std::vector<uint8_t> data = read_file(path);
    std::cout << hash_to_hex(hasher.hash(data)) << "  " << path << std::endl;
  }
  return 0;
}

int encodeCommand(const RuntimeOptions &opts, const Args &args) {
  if (args.positional.size() != 2)
    return usage();
  std::vector<uint8_t> input = read_file(args.positional[0]);
  Encoder encoder(make_compressor(opts.hashAlgorithm),
                  args.outboardFlag ? EncodingMode::Outboard
                                    : EncodingMode::Combined);
  FileWriter out(args.positional[1]);
  Hash root = encoder.encode_to(input, out);
  out.flush();
  std::cout << hash_to_hex(root) << std::endl;
  return 0;
}

// Decoder offsets are signed; anything above INT64_MAX cannot be sought to.
uint64_t parseOffset(const std::string &name, const std::string &value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
    throw std::invalid_argument(name + " is not a number: " + value);
  uint64_t parsed = 0;
  try {
    parsed = std::stoull(value);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(name + " out of range: " + value);
  }
  if (parsed > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    throw std::invalid_argument(name + " out of range: " + value);
  return parsed;
}

int decodeCommand(const RuntimeOptions &opts, const Args &args) {
  if (args.positional.size() != 3)
    return usage();
  Hash root = hex_to_hash(args.positional[0]);
  std::optional<int64_t> start;
  if (auto value = option(args, "start"))
    start = static_cast<int64_t>(parseOffset("--start", *value));
  std::optional<uint64_t> remaining;
  if (auto value = option(args, "count"))
    remaining = parseOffset("--count", *value);

  FileReader encoded(args.positional[1]);
  std::optional<FileReader> content;
  if (auto path = option(args, "outboard"))
    content.emplace(*path);

  auto compressor = make_compressor(opts.hashAlgorithm);
  std::optional<Decoder> decoder;
  if (content)
    decoder.emplace(encoded, *content, root, compressor);
  else
    decoder.emplace(encoded, root, compressor);

  if (start)
    decoder->seek(*start);

  FileWriter out(args.positional[2]);
  std::vector<uint8_t> buf(64 * 1024);
  while (!remaining || *remaining > 0) {
    size_t want = buf.size();
    if (remaining && *remaining < want)
      want = static_cast<size_t>(*remaining);
    size_t n = decoder->read(buf.data(), want);
    if (n == 0)
      break;
    out.write(buf.data(), n);
    if (remaining)
      *remaining -= n;
  }
  out.flush();
  return 0;
}

int sliceCommand(const RuntimeOptions &opts, const Args &args) {
  if (args.positional.size() != 4)
    return usage();
  uint64_t start = parseOffset("START", args.positional[2]);
  uint64_t count = parseOffset("COUNT", args.positional[3]);
  FileReader encoded(args.positional[0]);
  VectorWriter slice;
  if (auto path = option(args, "outboard")) {
    FileReader content(*path);
    SliceExtractor(encoded, content, opts.slicing).extract(start, count, slice);
  } else {
    SliceExtractor(encoded, opts.slicing).extract(start, count, slice);
  }
  FileWriter out(args.positional[1]);
  writeAll(out, slice.data());
  out.flush();
  return 0;
}

int decodeSliceCommand(const RuntimeOptions &opts, const Args &args) {
  if (args.positional.size() != 5)
    return usage();
  Hash root = hex_to_hash(args.positional[0]);
  uint64_t start = parseOffset("START", args.positional[3]);
  uint64_t count = parseOffset("COUNT", args.positional[4]);
  FileReader slice(args.positional[1]);
  SliceDecoder decoder(slice, root, start, count,
                       make_compressor(opts.hashAlgorithm), opts.slicing);
  std::vector<uint8_t> data = decoder.read_all();
  FileWriter out(args.positional[2]);
  writeAll(out, data);
  out.flush();
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    return usage();
  }
  RuntimeOptions opts = loadRuntimeOptions();
  Logger::init(opts.logFile, opts.logLevel);

  if (!primitive_self_test()) {
    std::cerr << "FATAL: primitive self test failed" << std::endl;
    return 2;
  }

  const std::string cmd = argv[1];
  try {
    if (cmd == "hash")
      return hashCommand(opts, parseArgs(argc, argv, 2, false));
    if (cmd == "encode")
      return encodeCommand(opts, parseArgs(argc, argv, 2, false));
    if (cmd == "decode")
      return decodeCommand(opts, parseArgs(argc, argv, 2, true));
    if (cmd == "slice")
      return sliceCommand(opts, parseArgs(argc, argv, 2, true));
    if (cmd == "decode-slice")
      return decodeSliceCommand(opts, parseArgs(argc, argv, 2, true));
  } catch (const TreeError &e) {
    std::cerr << "veritree_ctl: " << errorKindToString(e.kind()) << ": "
              << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "veritree_ctl: " << e.what() << std::endl;
    return 1;
  }
  std::cout << "Unknown command" << std::endl;
  return usage();
}
