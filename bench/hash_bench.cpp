#include "veritree/decoder.hpp"
#include "veritree/digest.hpp"
#include "veritree/encoder.hpp"
#include "veritree/io.hpp"
#include "veritree/logger.h"
#include "veritree/tree_hasher.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace veritree;

// Helper function to create a vector of bytes with random values
std::vector<uint8_t> create_random_byte_vector(size_t size) {
    std::vector<uint8_t> vec(size);
    std::generate(vec.begin(), vec.end(), []() {
        return static_cast<uint8_t>(std::rand() % 256);
    });
    return vec;
}

template <typename Fn>
double time_seconds(Fn&& fn) {
    auto start = std::chrono::high_resolution_clock::now();
    fn();
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> duration = end - start;
    return duration.count();
}

void report(const std::string& label, double total_mb, double seconds) {
    std::cout << label << ": " << seconds << " seconds";
    if (seconds > 0) {
        std::cout << " (" << total_mb / seconds << " MiB/s)";
    }
    std::cout << std::endl;
}

// Usage: hash_bench [MiB] [blake2b|blake3]
int main(int argc, char** argv) {
    Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
    std::srand(static_cast<unsigned int>(std::time(nullptr)));

    const size_t total_size_mib = argc > 1 ? std::stoul(argv[1]) : 256;
    const HashAlgorithm algo = argc > 2 ? algorithm_from_string(argv[2]) : HashAlgorithm::BLAKE2B;
    const size_t total_size_bytes = total_size_mib * 1024 * 1024;
    const double total_mb = static_cast<double>(total_size_mib);

    std::cout << "Preparing " << total_size_mib << " MiB of random data..." << std::endl;
    std::vector<uint8_t> data = create_random_byte_vector(total_size_bytes);
    auto compressor = make_compressor(algo);

    std::cout << "--- veritree Benchmark Results (" << algorithm_to_string(algo) << ") ---" << std::endl;

    Hash sequential_root{};
    HashOptions sequential;
    sequential.batch_width = 1;
    report("Hash, 1 worker, unbatched", total_mb, time_seconds([&] {
        sequential_root = TreeHasher(compressor, sequential).hash(data);
    }));

    const size_t cores = std::max(1u, std::thread::hardware_concurrency());
    HashOptions parallel;
    parallel.workers = cores;
    Hash parallel_root{};
    report("Hash, " + std::to_string(cores) + " workers", total_mb, time_seconds([&] {
        parallel_root = TreeHasher(compressor, parallel).hash(data);
    }));
    if (parallel_root != sequential_root) {
        std::cerr << "Error: parallel root differs from sequential root." << std::endl;
        return 1;
    }

    Hash streaming_root{};
    report("Streaming hasher", total_mb, time_seconds([&] {
        MemoryReader reader(data);
        streaming_root = hash_reader(reader, compressor);
    }));

    EncodeResult encoded;
    report("Combined encode", total_mb, time_seconds([&] {
        encoded = Encoder(compressor).encode(data);
    }));

    std::vector<uint8_t> decoded;
    report("Combined decode", total_mb, time_seconds([&] {
        MemoryReader reader(encoded.encoding);
        Decoder decoder(reader, encoded.root, compressor);
        decoded = decoder.read_all();
    }));

    if (decoded != data || streaming_root != sequential_root) {
        std::cerr << "Error: round trip verification failed." << std::endl;
        return 1;
    }
    std::cout << "Root hash: " << hash_to_hex(sequential_root) << std::endl;
    return 0;
}
