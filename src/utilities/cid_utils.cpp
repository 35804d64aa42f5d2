#include "utilities/cid_utils.hpp"
#include "cppcodec/base32_rfc4648.hpp"
#include "cppcodec/hex_lower.hpp"
#include "utilities/errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace dits::utils {

// CIDv1 (0x01)
// multicodec for DAG-PB (0x70)
// multicodec for SHA2-256 (0x12) or BLAKE3 (0x1e)
// length of hash (0x20)
const std::vector<uint8_t> CID_PREFIX_SHA256 = {0x01, 0x70, 0x12, 0x20};
const std::vector<uint8_t> CID_PREFIX_BLAKE3 = {0x01, 0x70, 0x1e, 0x20};

const char *hashAlgorithmName(HashAlgorithm algo) {
  return algo == HashAlgorithm::SHA256 ? "sha256" : "blake3";
}

HashAlgorithm parseHashAlgorithm(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "blake3")
    return HashAlgorithm::BLAKE3;
  if (lower == "sha256" || lower == "sha-256")
    return HashAlgorithm::SHA256;
  throwConfigError("unknown hash algorithm '" + name + "'");
}

std::string digest_to_cid(const DigestArray &digest, HashAlgorithm algo) {
  const auto &prefix =
      algo == HashAlgorithm::SHA256 ? CID_PREFIX_SHA256 : CID_PREFIX_BLAKE3;
  std::vector<uint8_t> bytes_to_encode;
  bytes_to_encode.insert(bytes_to_encode.end(), prefix.begin(), prefix.end());
  bytes_to_encode.insert(bytes_to_encode.end(), digest.begin(), digest.end());

  return cppcodec::base32_rfc4648::encode(bytes_to_encode);
}

DigestArray cid_to_digest(const std::string &cid, HashAlgorithm *algo_out) {
  if (cid.empty()) {
    throw std::runtime_error("CID string cannot be empty.");
  }

  std::vector<uint8_t> decoded_bytes;
  try {
    decoded_bytes = cppcodec::base32_rfc4648::decode(cid.data(), cid.length());
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to decode Base32 CID: " +
                             std::string(e.what()));
  }

  if (decoded_bytes.size() < CID_PREFIX_BLAKE3.size()) {
    throw std::runtime_error(
        "Invalid CID: Decoded data too short to contain prefix.");
  }

  HashAlgorithm algo;
  if (std::equal(CID_PREFIX_SHA256.begin(), CID_PREFIX_SHA256.end(),
                 decoded_bytes.begin())) {
    algo = HashAlgorithm::SHA256;
  } else if (std::equal(CID_PREFIX_BLAKE3.begin(), CID_PREFIX_BLAKE3.end(),
                        decoded_bytes.begin())) {
    algo = HashAlgorithm::BLAKE3;
  } else {
    throw std::runtime_error("Invalid CID: Prefix mismatch.");
  }

  // Both prefixes have the same length.
  const size_t prefix_size = CID_PREFIX_BLAKE3.size();
  if (decoded_bytes.size() != prefix_size + DIGEST_SIZE) {
    throw std::runtime_error("Invalid CID: Decoded data length does not match "
                             "expected digest size.");
  }

  DigestArray digest;
  std::copy(decoded_bytes.begin() + prefix_size, decoded_bytes.end(),
            digest.begin());

  if (algo_out) {
    *algo_out = algo;
  }
  return digest;
}

std::string digest_to_hex(const DigestArray &digest) {
  return cppcodec::hex_lower::encode(digest.data(), digest.size());
}

DigestArray hex_to_digest(const std::string &hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    throw std::runtime_error("Invalid digest hex: expected " +
                             std::to_string(DIGEST_SIZE * 2) +
                             " characters, got " + std::to_string(hex.size()));
  }
  std::vector<uint8_t> raw;
  try {
    raw = cppcodec::hex_lower::decode(hex.data(), hex.size());
  } catch (const std::exception &e) {
    throw std::runtime_error("Invalid digest hex: " + std::string(e.what()));
  }
  DigestArray digest;
  std::copy(raw.begin(), raw.end(), digest.begin());
  return digest;
}

} // namespace dits::utils

namespace dits {

std::string ContentHash::toHex() const { return utils::digest_to_hex(bytes); }

std::string ContentHash::shortHex() const { return toHex().substr(0, 8); }

std::string ContentHash::toCid(utils::HashAlgorithm algo) const {
  return utils::digest_to_cid(bytes, algo);
}

ContentHash ContentHash::fromHex(const std::string &hex) {
  try {
    return ContentHash{utils::hex_to_digest(hex)};
  } catch (const std::runtime_error &e) {
    throw IntegrityError(e.what());
  }
}

ContentHash ContentHash::fromCid(const std::string &cid) {
  try {
    return ContentHash{utils::cid_to_digest(cid)};
  } catch (const std::runtime_error &e) {
    throw IntegrityError(e.what());
  }
}

} // namespace dits
