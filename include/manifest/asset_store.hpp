#ifndef DITS_ASSET_STORE_HPP
#define DITS_ASSET_STORE_HPP

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "manifest/asset.hpp"
#include "manifest/manifest.hpp"
#include "storage/chunk_backend.hpp"

namespace dits {

/**
 * @brief Persists asset records, metadata blobs and manifests.
 *
 * Every object is keyed by the hex form of its own hash and checked
 * against it when loaded. Missing objects raise NotFoundError, objects that
 * fail the check raise IntegrityError.
 */
class AssetStore {
public:
  AssetStore(std::shared_ptr<ChunkBackend> assets,
             std::shared_ptr<ChunkBackend> blobs,
             std::shared_ptr<ChunkBackend> manifests,
             utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3);

  /// "assets/<hh>/<rest>.json", "blobs/<hh>/<rest>", "manifests/<hh>/<rest>.json".
  static std::unique_ptr<AssetStore>
  openDirectories(const std::string &assetsDir, const std::string &blobsDir,
                  const std::string &manifestsDir,
                  utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3);

  static std::unique_ptr<AssetStore>
  inMemory(utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3);

  /// Writes the metadata blob then the asset record.
  void saveAsset(const Asset &asset);
  /// @p path is attached to the result; records do not store one.
  Asset loadAsset(const ContentHash &id, const std::string &path = {}) const;
  bool hasAsset(const ContentHash &id) const;

  ContentHash saveBlob(std::span<const std::byte> blob);
  std::vector<std::byte> loadBlob(const ContentHash &hash) const;

  ContentHash saveManifest(const Manifest &manifest);
  Manifest loadManifest(const ContentHash &id) const;
  bool hasManifest(const ContentHash &id) const;
  void removeManifest(const ContentHash &id);
  std::vector<ContentHash> listManifests() const;

private:
  static std::vector<std::byte> encode(const nlohmann::json &doc);
  static nlohmann::json decode(const std::vector<std::byte> &bytes,
                               const std::string &what);

  std::shared_ptr<ChunkBackend> assets_;
  std::shared_ptr<ChunkBackend> blobs_;
  std::shared_ptr<ChunkBackend> manifests_;
  utils::HashAlgorithm algo_;
};

} // namespace dits

#endif // DITS_ASSET_STORE_HPP
