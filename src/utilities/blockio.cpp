#include "utilities/blockio.hpp"
#include "utilities/cid_utils.hpp"

#include <stdexcept>

namespace dits {

BlockIO::BlockIO(int compression_level, utils::HashAlgorithm hash_algo)
    : compression_level_(compression_level), hash_algo_(hash_algo) {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }

  if (hash_algo_ == utils::HashAlgorithm::SHA256) {
    crypto_hash_sha256_init(&sha_state_);
  } else {
    blake3_hasher_init(&blake3_state_);
  }
}

void BlockIO::enable_buffering(bool enable) { buffering_enabled_ = enable; }

void BlockIO::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after the block has been finalized.");
  }
  if (!data || size == 0)
    return;
  if (buffering_enabled_)
    buffer_.insert(buffer_.end(), data, data + size);
  if (hash_algo_ == utils::HashAlgorithm::SHA256) {
    crypto_hash_sha256_update(
        &sha_state_, reinterpret_cast<const unsigned char *>(data), size);
  } else {
    blake3_hasher_update(&blake3_state_, reinterpret_cast<const uint8_t *>(data),
                         size);
  }
}

ContentHash BlockIO::finish_digest() {
  if (finalized_) {
    throw std::logic_error("BlockIO already finalized.");
  }
  ContentHash h;
  if (hash_algo_ == utils::HashAlgorithm::SHA256) {
    crypto_hash_sha256_final(&sha_state_, h.bytes.data());
  } else {
    blake3_hasher_finalize(&blake3_state_, h.bytes.data(), utils::DIGEST_SIZE);
  }
  finalized_ = true;
  return h;
}

DigestResult BlockIO::finalize_hashed() {
  DigestResult result;
  result.hash = finish_digest();
  result.cid = result.hash.toCid(hash_algo_);
  result.raw = buffer_;
  return result;
}

ContentHash BlockIO::hash(std::span<const std::byte> data,
                          utils::HashAlgorithm algo) {
  ContentHash h;
  if (algo == utils::HashAlgorithm::SHA256) {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
    crypto_hash_sha256(h.bytes.data(),
                       reinterpret_cast<const unsigned char *>(data.data()),
                       data.size());
  } else {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, reinterpret_cast<const uint8_t *>(data.data()),
                         data.size());
    blake3_hasher_finalize(&hasher, h.bytes.data(), utils::DIGEST_SIZE);
  }
  return h;
}

std::vector<std::byte>
BlockIO::compress_data(const std::vector<std::byte> &plaintext_data) const {
  if (plaintext_data.empty()) {
    return {};
  }

  size_t const cBuffSize = ZSTD_compressBound(plaintext_data.size());
  std::vector<std::byte> compressed_data(cBuffSize);

  size_t const cSize =
      ZSTD_compress(compressed_data.data(), cBuffSize, plaintext_data.data(),
                    plaintext_data.size(), compression_level_);

  if (ZSTD_isError(cSize)) {
    throw std::runtime_error(std::string("ZSTD_compress failed: ") +
                             ZSTD_getErrorName(cSize));
  }

  compressed_data.resize(cSize);
  return compressed_data;
}

std::vector<std::byte>
BlockIO::decompress_data(const std::vector<std::byte> &compressed_data,
                         size_t original_size) const {
  if (compressed_data.empty()) {
    return {};
  }
  if (original_size == 0) {
    unsigned long long const rSize = ZSTD_getFrameContentSize(
        compressed_data.data(), compressed_data.size());
    if (rSize == ZSTD_CONTENTSIZE_ERROR || rSize == ZSTD_CONTENTSIZE_UNKNOWN) {
      throw std::runtime_error(
          "ZSTD_decompress failed: original size unknown and not present in "
          "the frame.");
    }
    original_size = static_cast<size_t>(rSize);
    if (original_size == 0) {
      return {};
    }
  }

  std::vector<std::byte> decompressed_data(original_size);

  size_t const dSize =
      ZSTD_decompress(decompressed_data.data(), original_size,
                      compressed_data.data(), compressed_data.size());

  if (ZSTD_isError(dSize)) {
    throw std::runtime_error(std::string("ZSTD_decompress failed: ") +
                             ZSTD_getErrorName(dSize));
  }
  if (dSize != original_size) {
    throw std::runtime_error(
        "ZSTD_decompress failed: output size does not match original size.");
  }
  return decompressed_data;
}

} // namespace dits
