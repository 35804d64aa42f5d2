#ifndef DITS_BLOCKIO_HPP
#define DITS_BLOCKIO_HPP

#include <cstddef>
#include <span>
#include <string>
#include <vector>

#include "blake3.h"
#include <sodium.h>
#include <zstd.h>

#include "utilities/digest.hpp"

namespace dits {

struct DigestResult {
  ContentHash hash;
  std::string cid; // Content Identifier (CID) of the hashed data
  std::vector<std::byte> raw;
};

/**
 * @brief Incremental block hashing plus the zstd codec used for stored
 * chunks.
 *
 * Hashing always runs over the plaintext so compression never changes a
 * block's identity.
 */
class BlockIO {
public:
  /**
   * @brief Construct a new BlockIO processor.
   * @param compression_level Zstd compression level to use.
   * @param hash_algo Digest used for content identifiers.
   */
  explicit BlockIO(int compression_level = 1,
                   utils::HashAlgorithm hash_algo =
                       utils::HashAlgorithm::BLAKE3);

  /** Keep ingested bytes for DigestResult::raw. */
  void enable_buffering(bool enable);

  // Appends data to the internal buffer and updates the digest.
  void ingest(const std::byte *data, size_t size);
  void ingest(std::span<const std::byte> data) {
    ingest(data.data(), data.size());
  }

  // Finalizes the hash and returns the digest and raw data.
  DigestResult finalize_hashed();

  /// One-shot digest of @p data.
  static ContentHash hash(std::span<const std::byte> data,
                          utils::HashAlgorithm algo =
                              utils::HashAlgorithm::BLAKE3);

  // Compression methods
  std::vector<std::byte>
  compress_data(const std::vector<std::byte> &plaintext_data) const;
  std::vector<std::byte>
  decompress_data(const std::vector<std::byte> &compressed_data,
                  size_t original_size) const;

private:
  ContentHash finish_digest();

  std::vector<std::byte> buffer_;
  crypto_hash_sha256_state sha_state_;
  blake3_hasher blake3_state_;
  bool finalized_ = false;
  int compression_level_ = 1; ///< Zstd compression level
  utils::HashAlgorithm hash_algo_ = utils::HashAlgorithm::BLAKE3;
  bool buffering_enabled_ = true;
};

} // namespace dits

#endif // DITS_BLOCKIO_HPP
