#ifndef DITS_CID_UTILS_HPP
#define DITS_CID_UTILS_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "digest.hpp"

namespace dits::utils {

extern const std::vector<uint8_t> CID_PREFIX_SHA256;
extern const std::vector<uint8_t> CID_PREFIX_BLAKE3;

/**
 * @brief Converts a digest to a CIDv1 string.
 * @param digest The hash digest.
 * @return The CIDv1 string.
 */
std::string digest_to_cid(const DigestArray &digest,
                          HashAlgorithm algo = HashAlgorithm::BLAKE3);

/**
 * @brief Converts a CIDv1 string to its digest.
 * @param cid The CIDv1 string.
 * @return The extracted digest.
 * @throws std::runtime_error if the CID is invalid.
 */
DigestArray cid_to_digest(const std::string &cid,
                          HashAlgorithm *algo_out = nullptr);

/// Lowercase hex encoding of a digest.
std::string digest_to_hex(const DigestArray &digest);

/// Inverse of digest_to_hex. Throws std::runtime_error on malformed input.
DigestArray hex_to_digest(const std::string &hex);

} // namespace dits::utils

#endif // DITS_CID_UTILS_HPP
