#ifndef DITS_ASSET_HPP
#define DITS_ASSET_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunking/chunker.hpp"
#include "utilities/digest.hpp"

namespace dits {

/**
 * @brief Recipe for one file at one version.
 *
 * Concatenating @ref chunks in order yields the payload. The identity
 * covers the metadata blob and the chunk hash sequence but not the path,
 * so identical files at different paths share one asset.
 */
struct Asset {
  ContentHash id;
  /// Where the asset was added from or is listed in a manifest. Not
  /// persisted with the record.
  std::string path;
  std::vector<std::byte> metadata_blob;
  ContentHash metadata_hash;
  std::vector<Chunk> chunks;
  ContentHash sequence_hash;
  uint64_t size{0};
  utils::HashAlgorithm hash_algorithm{utils::HashAlgorithm::BLAKE3};
};

/// Computes asset identities.
class ManifestBuilder {
public:
  explicit ManifestBuilder(
      utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3)
      : algo_(algo) {}

  /**
   * @brief Assemble an asset from chunker output.
   *
   * Offsets are rewritten to the running position so they describe the
   * asset rather than the stream the chunks were cut from.
   */
  Asset build(const std::string &path, std::vector<std::byte> metadataBlob,
              std::vector<Chunk> chunks) const;

  /// Same payload, new metadata: new id, untouched chunk list.
  Asset withMetadata(const Asset &asset,
                     std::vector<std::byte> metadataBlob) const;

  /// Hash of the concatenated chunk hashes. Empty input hashes zero bytes.
  ContentHash sequenceHash(const std::vector<Chunk> &chunks) const;

  /// Hash of the 8 byte little-endian blob length, the blob and @p sequence.
  ContentHash assetId(std::span<const std::byte> metadataBlob,
                      const ContentHash &sequence) const;

  utils::HashAlgorithm hashAlgorithm() const { return algo_; }

private:
  utils::HashAlgorithm algo_;
};

/// Asset record without the metadata blob, which is stored on its own,
/// and without the path, which belongs to the manifest.
nlohmann::json assetToJson(const Asset &asset);

/**
 * @brief Rebuild an asset record and check its identity.
 * @param path Path to attach, usually the manifest entry's key.
 * @throw IntegrityError if the record is malformed or its id does not match
 *        its content.
 */
Asset assetFromJson(const nlohmann::json &record,
                    std::vector<std::byte> metadataBlob,
                    const std::string &path = {});

} // namespace dits

#endif // DITS_ASSET_HPP
