#ifndef DITS_CHUNKER_HPP
#define DITS_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <span>
#include <stop_token>
#include <utility>
#include <vector>

#include "utilities/config.hpp"
#include "utilities/digest.hpp"

namespace dits {

/// Immutable, content-identified slice of a byte stream.
struct Chunk {
  ContentHash hash;
  uint64_t offset{0}; ///< Provenance only, not part of identity.
  uint32_t length{0};
  bool is_boundary_hint{false};
};

/**
 * @brief Content-defined chunker.
 *
 * A buzhash over a kRollingWindowSize byte window is restarted at every cut.
 * A boundary is declared where the low bits of the hash selected by
 * ChunkerConfig::mask() are all zero, no earlier than min_size and no later
 * than max_size. Only the last chunk of a stream may be shorter than
 * min_size.
 *
 * At most max_size + hint_tolerance bytes plus one read block are buffered,
 * whatever the stream length.
 */
class Chunker {
public:
  /// Receives each chunk together with its bytes. The span is only valid
  /// during the call.
  using ChunkSink =
      std::function<void(const Chunk &, std::span<const std::byte>)>;

  /// @throw ConfigError if @p config is inconsistent.
  explicit Chunker(ChunkerConfig config = {},
                   utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3);

  const ChunkerConfig &config() const { return config_; }
  utils::HashAlgorithm hashAlgorithm() const { return algo_; }

  /**
   * @brief Stream @p in through the chunker.
   *
   * @param hints Sorted preferred cut offsets (see normalizeHints()).
   * @throw IoError if the stream fails for a reason other than end of file.
   * @throw CancelledError if @p stop is requested; the partial chunk is
   *        discarded and never reaches @p sink.
   */
  void forEachChunk(std::istream &in, const ChunkSink &sink,
                    const std::vector<uint64_t> &hints = {},
                    std::stop_token stop = {}) const;

  /// Chunk boundaries and hashes for @p in.
  std::vector<Chunk> chunk(std::istream &in,
                           const std::vector<uint64_t> &hints = {},
                           std::stop_token stop = {}) const;

  /// Chunk an in-memory buffer.
  std::vector<Chunk> chunk(std::span<const std::byte> data,
                           const std::vector<uint64_t> &hints = {}) const;

  /**
   * @brief Locate the next content-defined cut in @p data.
   *
   * @param limit Number of bytes that may be consumed (at most max_size).
   * @return Length of the chunk and whether the rolling hash chose it.
   */
  std::pair<size_t, bool> findBoundary(const std::byte *data,
                                       size_t limit) const;

private:
  /// Move @p cut onto the closest acceptable hint, if any.
  bool snapToHint(const std::vector<uint64_t> &hints, uint64_t chunkStart,
                  size_t available, size_t &cut) const;

  ChunkerConfig config_;
  utils::HashAlgorithm algo_;
  uint64_t mask_;
};

} // namespace dits

#endif // DITS_CHUNKER_HPP
