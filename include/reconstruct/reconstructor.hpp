#ifndef DITS_RECONSTRUCTOR_HPP
#define DITS_RECONSTRUCTOR_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

#include "manifest/asset.hpp"
#include "storage/chunk_store.hpp"

namespace dits {

/// Receives reconstructed bytes in order.
using ByteSink = std::function<void(std::span<const std::byte>)>;

/**
 * @brief Rebuilds asset payloads from the chunk store.
 *
 * Every chunk is checked for length and hash before it reaches the sink.
 * Only one chunk is held in memory at a time.
 */
class Reconstructor {
public:
  explicit Reconstructor(ChunkStore &store) : store_(store) {}

  /**
   * @throw IntegrityError naming the chunk hash, index and byte offset of
   *        the first chunk that fails verification.
   * @throw NotFoundError if a chunk is missing from the store.
   * @throw CancelledError if @p stop is requested between chunks.
   */
  void reconstruct(const Asset &asset, const ByteSink &sink,
                   std::stop_token stop = {}) const;

  /// Stream into @p out. @throw IoError if the stream fails.
  void reconstruct(const Asset &asset, std::ostream &out,
                   std::stop_token stop = {}) const;

  std::vector<std::byte> reconstructToBytes(const Asset &asset) const;

  /**
   * @brief Write bytes [offset, offset + length) of the payload.
   *
   * Only the chunks covering the range are fetched. The range is clamped
   * to the payload.
   * @return Number of bytes written.
   */
  uint64_t reconstructRange(const Asset &asset, uint64_t offset,
                            uint64_t length, const ByteSink &sink,
                            std::stop_token stop = {}) const;

  /**
   * @brief Write the payload to @p path.
   *
   * Data goes to "<path>.dits-tmp" which is renamed over @p path once
   * complete. On failure the temporary file is removed and @p path is left
   * as it was.
   */
  void exportToFile(const Asset &asset, const std::string &path,
                    std::stop_token stop = {}) const;

private:
  std::vector<std::byte> fetch(const Asset &asset, size_t index,
                               uint64_t offset) const;

  ChunkStore &store_;
};

} // namespace dits

#endif // DITS_RECONSTRUCTOR_HPP
