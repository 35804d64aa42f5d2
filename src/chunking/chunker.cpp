#include "chunking/chunker.hpp"
#include "utilities/blockio.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <array>
#include <streambuf>

namespace dits {

namespace {

constexpr size_t kReadBlock = 64 * 1024;

// Buzhash substitution table. Generated with splitmix64 from a fixed seed;
// changing the seed moves every boundary.
const std::array<uint64_t, 256> &buzhashTable() {
  static const std::array<uint64_t, 256> table = [] {
    std::array<uint64_t, 256> t{};
    uint64_t state = 0x6469747362757a68ULL;
    for (auto &v : t) {
      state += 0x9e3779b97f4a7c15ULL;
      uint64_t z = state;
      z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
      z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
      v = z ^ (z >> 31);
    }
    return t;
  }();
  return table;
}

inline uint64_t rotl(uint64_t v, unsigned n) {
  n &= 63;
  return n == 0 ? v : (v << n) | (v >> (64 - n));
}

// Read-only streambuf over caller memory.
class MemoryBuf : public std::streambuf {
public:
  MemoryBuf(const std::byte *data, size_t size) {
    char *p = const_cast<char *>(reinterpret_cast<const char *>(data));
    setg(p, p, p + size);
  }
};

} // namespace

Chunker::Chunker(ChunkerConfig config, utils::HashAlgorithm algo)
    : config_(config), algo_(algo) {
  config_.validate();
  mask_ = config_.mask();
}

std::pair<size_t, bool> Chunker::findBoundary(const std::byte *data,
                                              size_t limit) const {
  limit = std::min<size_t>(limit, config_.max_size);
  if (limit <= config_.min_size)
    return {limit, false};

  const auto &table = buzhashTable();
  const size_t window = kRollingWindowSize;
  uint64_t h = 0;

  // Prime the window with the bytes that end at min_size.
  for (size_t i = config_.min_size - window; i < config_.min_size; ++i)
    h = rotl(h, 1) ^ table[static_cast<uint8_t>(data[i])];

  for (size_t i = config_.min_size; i < limit; ++i) {
    const uint8_t out = static_cast<uint8_t>(data[i - window]);
    const uint8_t in = static_cast<uint8_t>(data[i]);
    h = rotl(h, 1) ^ rotl(table[out], window) ^ table[in];
    if ((h & mask_) == 0)
      return {i + 1, true};
  }
  return {limit, false};
}

bool Chunker::snapToHint(const std::vector<uint64_t> &hints,
                         uint64_t chunkStart, size_t available,
                         size_t &cut) const {
  if (hints.empty())
    return false;
  const uint64_t target = chunkStart + cut;
  const uint64_t tol = config_.hint_tolerance;
  const uint64_t lo = target > tol ? target - tol : 0;
  const uint64_t hi = target + tol;
  const uint64_t maxLen = std::min<uint64_t>(config_.max_size, available);

  bool found = false;
  uint64_t best = 0;
  uint64_t bestDistance = 0;
  for (auto it = std::lower_bound(hints.begin(), hints.end(), lo);
       it != hints.end() && *it <= hi; ++it) {
    if (*it <= chunkStart)
      continue;
    const uint64_t len = *it - chunkStart;
    if (len < config_.min_size || len > maxLen)
      continue;
    const uint64_t distance = *it > target ? *it - target : target - *it;
    // Ties resolve to the earlier hint since iteration is ascending.
    if (!found || distance < bestDistance) {
      found = true;
      best = len;
      bestDistance = distance;
    }
  }
  if (found)
    cut = static_cast<size_t>(best);
  return found;
}

void Chunker::forEachChunk(std::istream &in, const ChunkSink &sink,
                           const std::vector<uint64_t> &hints,
                           std::stop_token stop) const {
  const size_t wanted =
      static_cast<size_t>(config_.max_size) + config_.hint_tolerance;
  std::vector<std::byte> buffer;
  buffer.reserve(wanted + kReadBlock);
  size_t start = 0;          // index of the current chunk in buffer
  uint64_t streamOffset = 0; // stream offset of buffer[start]
  bool eof = false;
  size_t emitted = 0;

  while (true) {
    if (stop.stop_requested())
      throw CancelledError("chunking");

    // Refill so the buffer holds max_size + tolerance bytes past start.
    while (!eof && buffer.size() - start < wanted) {
      if (start > 0) {
        buffer.erase(buffer.begin(), buffer.begin() + start);
        start = 0;
      }
      const size_t old = buffer.size();
      buffer.resize(old + kReadBlock);
      in.read(reinterpret_cast<char *>(buffer.data() + old), kReadBlock);
      const std::streamsize got = in.gcount();
      buffer.resize(old + static_cast<size_t>(std::max<std::streamsize>(got, 0)));
      if (in.bad())
        throwIoError("stream read failed at offset " +
                     std::to_string(streamOffset + buffer.size()));
      if (in.eof())
        eof = true;
      else if (in.fail())
        throwIoError("stream entered a failed state at offset " +
                     std::to_string(streamOffset + buffer.size()));
    }

    const size_t available = buffer.size() - start;
    if (available == 0)
      break;

    auto [cut, byHash] = findBoundary(buffer.data() + start, available);
    const bool finalTail = eof && !byHash && cut == available;
    bool hinted = false;
    if (!finalTail)
      hinted = snapToHint(hints, streamOffset, available, cut);

    std::span<const std::byte> bytes(buffer.data() + start, cut);
    Chunk c;
    c.hash = BlockIO::hash(bytes, algo_);
    c.offset = streamOffset;
    c.length = static_cast<uint32_t>(cut);
    c.is_boundary_hint = hinted;
    sink(c, bytes);
    MetricsRegistry::instance().observe("dits_chunk_size_bytes", cut);
    ++emitted;

    start += cut;
    streamOffset += cut;
  }

  Logger::getInstance().log(LogLevel::DEBUG,
                            "Chunked " + std::to_string(streamOffset) +
                                " bytes into " + std::to_string(emitted) +
                                " chunks");
}

std::vector<Chunk> Chunker::chunk(std::istream &in,
                                  const std::vector<uint64_t> &hints,
                                  std::stop_token stop) const {
  std::vector<Chunk> chunks;
  forEachChunk(
      in,
      [&chunks](const Chunk &c, std::span<const std::byte>) {
        chunks.push_back(c);
      },
      hints, stop);
  return chunks;
}

std::vector<Chunk> Chunker::chunk(std::span<const std::byte> data,
                                  const std::vector<uint64_t> &hints) const {
  MemoryBuf buf(data.data(), data.size());
  std::istream in(&buf);
  return chunk(in, hints);
}

} // namespace dits
