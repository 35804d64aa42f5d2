#include "manifest/asset_store.hpp"
#include "utilities/blockio.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>

namespace dits {

AssetStore::AssetStore(std::shared_ptr<ChunkBackend> assets,
                       std::shared_ptr<ChunkBackend> blobs,
                       std::shared_ptr<ChunkBackend> manifests,
                       utils::HashAlgorithm algo)
    : assets_(std::move(assets)), blobs_(std::move(blobs)),
      manifests_(std::move(manifests)), algo_(algo) {
  if (!assets_ || !blobs_ || !manifests_)
    throwConfigError("asset store requires three backends");
}

std::unique_ptr<AssetStore>
AssetStore::openDirectories(const std::string &assetsDir,
                            const std::string &blobsDir,
                            const std::string &manifestsDir,
                            utils::HashAlgorithm algo) {
  return std::make_unique<AssetStore>(
      std::make_shared<FilesystemChunkBackend>(assetsDir, ".json"),
      std::make_shared<FilesystemChunkBackend>(blobsDir),
      std::make_shared<FilesystemChunkBackend>(manifestsDir, ".json"), algo);
}

std::unique_ptr<AssetStore> AssetStore::inMemory(utils::HashAlgorithm algo) {
  return std::make_unique<AssetStore>(std::make_shared<MemoryChunkBackend>(),
                                      std::make_shared<MemoryChunkBackend>(),
                                      std::make_shared<MemoryChunkBackend>(),
                                      algo);
}

std::vector<std::byte> AssetStore::encode(const nlohmann::json &doc) {
  const std::string text = doc.dump(2);
  const auto *p = reinterpret_cast<const std::byte *>(text.data());
  return std::vector<std::byte>(p, p + text.size());
}

nlohmann::json AssetStore::decode(const std::vector<std::byte> &bytes,
                                  const std::string &what) {
  const std::string text(reinterpret_cast<const char *>(bytes.data()),
                         bytes.size());
  nlohmann::json doc =
      nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object())
    throwIntegrityError("malformed " + what);
  return doc;
}

void AssetStore::saveAsset(const Asset &asset) {
  saveBlob(asset.metadata_blob);
  assets_->write(asset.id.toHex(), encode(assetToJson(asset)));
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Saved asset " + asset.id.shortHex() + " (" +
                                std::to_string(asset.chunks.size()) +
                                " chunks)");
}

Asset AssetStore::loadAsset(const ContentHash &id,
                            const std::string &path) const {
  const std::string key = id.toHex();
  const nlohmann::json record = decode(assets_->read(key), "asset " + key);
  ContentHash metadataHash;
  try {
    metadataHash = ContentHash::fromHex(record.at("metadata").get<std::string>());
  } catch (const nlohmann::json::exception &e) {
    throwIntegrityError("malformed asset " + key + ": " + e.what());
  }
  Asset asset = assetFromJson(record, loadBlob(metadataHash), path);
  if (asset.id != id)
    throwIntegrityError("asset stored under " + key + " has id " +
                        asset.id.toHex());
  return asset;
}

bool AssetStore::hasAsset(const ContentHash &id) const {
  return assets_->exists(id.toHex());
}

ContentHash AssetStore::saveBlob(std::span<const std::byte> blob) {
  const ContentHash hash = BlockIO::hash(blob, algo_);
  const std::string key = hash.toHex();
  if (!blobs_->exists(key))
    blobs_->write(key, std::vector<std::byte>(blob.begin(), blob.end()));
  return hash;
}

std::vector<std::byte> AssetStore::loadBlob(const ContentHash &hash) const {
  std::vector<std::byte> blob = blobs_->read(hash.toHex());
  if (BlockIO::hash(blob, algo_) != hash)
    throwIntegrityError("metadata blob does not match its hash",
                        hash.toHex());
  return blob;
}

ContentHash AssetStore::saveManifest(const Manifest &manifest) {
  const ContentHash id = manifest.id(algo_);
  manifests_->write(id.toHex(), encode(manifest.toJson()));
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Saved manifest " + id.shortHex() + " with " +
                                std::to_string(manifest.size()) + " entries");
  return id;
}

Manifest AssetStore::loadManifest(const ContentHash &id) const {
  const std::string key = id.toHex();
  Manifest manifest =
      Manifest::fromJson(decode(manifests_->read(key), "manifest " + key));
  if (manifest.id(algo_) != id)
    throwIntegrityError("manifest stored under " + key +
                        " does not match its content");
  return manifest;
}

bool AssetStore::hasManifest(const ContentHash &id) const {
  return manifests_->exists(id.toHex());
}

void AssetStore::removeManifest(const ContentHash &id) {
  const std::string key = id.toHex();
  if (!manifests_->exists(key))
    throwNotFound(key);
  manifests_->remove(key);
}

// Lowercase hex of a full digest, as ContentHash::toHex writes it.
static bool isDigestKey(const std::string &key) {
  return key.size() == 2 * utils::DIGEST_SIZE &&
         std::all_of(key.begin(), key.end(), [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

std::vector<ContentHash> AssetStore::listManifests() const {
  std::vector<ContentHash> ids;
  for (const auto &key : manifests_->list()) {
    if (!isDigestKey(key)) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Skipping stray manifest key " + key);
      continue;
    }
    ids.push_back(ContentHash::fromHex(key));
  }
  return ids;
}

} // namespace dits
