#include "chunking/chunker.hpp"
#include "utilities/blockio.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

using namespace dits;

// Fill a buffer with reproducible pseudo-random bytes.
std::vector<std::byte> create_random_byte_vector(size_t size, uint32_t seed) {
    std::mt19937 gen(seed);
    std::vector<std::byte> vec(size);
    for (auto &b : vec)
        b = static_cast<std::byte>(gen() >> 24);
    return vec;
}

void run_preset(const std::string &name, const std::vector<std::byte> &data,
                const std::vector<std::byte> &edited) {
    Chunker chunker(ChunkerConfig::preset(name));

    auto start = std::chrono::high_resolution_clock::now();
    std::vector<Chunk> chunks = chunker.chunk(data);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> duration = end - start;

    std::vector<Chunk> editedChunks = chunker.chunk(edited);
    std::unordered_set<ContentHash> original;
    for (const auto &c : chunks)
        original.insert(c.hash);
    size_t reused = 0;
    for (const auto &c : editedChunks)
        reused += original.count(c.hash);

    double total_mib = static_cast<double>(data.size()) / (1024 * 1024);
    std::cout << "--- Preset " << name << " ---" << std::endl;
    std::cout << "Chunks: " << chunks.size() << " (average "
              << (chunks.empty() ? 0 : data.size() / chunks.size())
              << " bytes)" << std::endl;
    std::cout << "Chunk + hash time: " << duration.count() << " seconds"
              << std::endl;
    if (duration.count() > 0)
        std::cout << "Throughput: " << total_mib / duration.count()
                  << " MiB/s" << std::endl;
    std::cout << "Reused after 64 scattered edits: " << reused << " of "
              << editedChunks.size() << std::endl;
}

int main(int argc, char **argv) {
    size_t total_mib = 256;
    if (argc > 1)
        total_mib = static_cast<size_t>(std::strtoul(argv[1], nullptr, 10));
    const size_t total_size_bytes = total_mib * 1024 * 1024;

    std::cout << "Preparing " << total_mib << " MiB of data..." << std::endl;
    const std::vector<std::byte> data =
        create_random_byte_vector(total_size_bytes, 42);
    std::vector<std::byte> edited = data;
    std::mt19937 gen(7);
    for (int i = 0; i < 64 && !edited.empty(); ++i)
        edited[gen() % edited.size()] ^= std::byte{0xff};
    std::cout << "Data preparation complete." << std::endl;

    auto hash_start = std::chrono::high_resolution_clock::now();
    ContentHash digest = BlockIO::hash(data);
    auto hash_end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> hash_duration = hash_end - hash_start;
    std::cout << "--- BLAKE3 baseline ---" << std::endl;
    std::cout << "Digest: " << digest.toHex() << std::endl;
    std::cout << "Time: " << hash_duration.count() << " seconds" << std::endl;

    for (const char *preset : {"small", "project", "default", "media"})
        run_preset(preset, data, edited);
    return 0;
}
