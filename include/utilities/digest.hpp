#ifndef DITS_DIGEST_HPP
#define DITS_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace dits::utils {

/// Supported hashing algorithms.
enum class HashAlgorithm { SHA256, BLAKE3 };

/// Digest size for supported algorithms (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

const char *hashAlgorithmName(HashAlgorithm algo);

/// Parse "blake3" or "sha256" (case-insensitive). Throws ConfigError.
HashAlgorithm parseHashAlgorithm(const std::string &name);

} // namespace dits::utils

namespace dits {

/**
 * @brief Fixed-length content identifier.
 *
 * Equality is bytewise. The lowercase hex form is the storage key; the
 * CID form is what users see.
 */
struct ContentHash {
  utils::DigestArray bytes{};

  std::string toHex() const;
  /// First 8 hex characters, for log lines.
  std::string shortHex() const;
  std::string toCid(utils::HashAlgorithm algo =
                        utils::HashAlgorithm::BLAKE3) const;

  /// Throws IntegrityError if @p hex is not 64 hex characters.
  static ContentHash fromHex(const std::string &hex);
  static ContentHash fromCid(const std::string &cid);

  bool operator==(const ContentHash &other) const {
    return bytes == other.bytes;
  }
  bool operator!=(const ContentHash &other) const { return !(*this == other); }
  bool operator<(const ContentHash &other) const { return bytes < other.bytes; }
};

} // namespace dits

template <> struct std::hash<dits::ContentHash> {
  size_t operator()(const dits::ContentHash &h) const noexcept {
    // The digest is uniformly distributed, the first word is enough.
    size_t v = 0;
    for (size_t i = 0; i < sizeof(size_t); ++i)
      v = (v << 8) | h.bytes[i];
    return v;
  }
};

#endif // DITS_DIGEST_HPP
