#ifndef DITS_STORAGE_ENGINE_HPP
#define DITS_STORAGE_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "chunking/chunker.hpp"
#include "chunking/hint_provider.hpp"
#include "diff/diff_engine.hpp"
#include "manifest/asset.hpp"
#include "manifest/asset_store.hpp"
#include "manifest/manifest.hpp"
#include "reconstruct/reconstructor.hpp"
#include "storage/chunk_store.hpp"
#include "utilities/config.hpp"

namespace dits {

/**
 * @brief Entry point used by the commit layer.
 *
 * Reference rules: chunkAndStore() takes one reference per distinct chunk
 * of the new asset on behalf of the caller. retainAsset()/releaseAsset()
 * add or drop one reference per distinct chunk. commitManifest() retains
 * every asset it names and dropManifest() releases them again. Any
 * operation that fails part way releases the references it already took.
 */
class StorageEngine {
public:
  /**
   * @brief Open the repository described by @p config.
   *
   * With the "filesystem" backend, state lives under config.var_dir (or
   * the current var dir) and the chunk index is recovered from the last
   * checkpoint plus the reference log. The "memory" backend keeps
   * everything in process.
   */
  explicit StorageEngine(EngineConfig config);

  StorageEngine(const StorageEngine &) = delete;
  StorageEngine &operator=(const StorageEngine &) = delete;

  /**
   * @brief Chunk @p in, store its chunks and record the asset.
   *
   * @param hints Optional provider. It is run first and the stream is then
   *        rewound, so @p in must be seekable when one is given.
   * @throw IoError, CancelledError; no references survive a failure.
   */
  Asset chunkAndStore(const std::string &path, std::istream &in,
                      std::vector<std::byte> metadata = {},
                      const HintProvider &hints = {},
                      std::stop_token stop = {});

  /// Add a file from disk. @p logicalPath defaults to @p fsPath.
  Asset addFile(const std::string &fsPath, const std::string &logicalPath = {},
                const HintProvider &hints = {}, std::stop_token stop = {});

  /**
   * @brief Add several files on up to worker_threads threads.
   *
   * Results keep the order of @p fsPaths. If any file fails the others are
   * released and the first error is rethrown.
   */
  std::vector<Asset> addFiles(const std::vector<std::string> &fsPaths,
                              const HintProvider &hints = {});

  void retainAsset(const Asset &asset);
  void releaseAsset(const Asset &asset);

  /// Metadata-only edit; no chunk is read or re-stored.
  Asset updateMetadata(const Asset &asset, std::vector<std::byte> metadata);

  /// Retain every asset in @p manifest and persist it. @return manifest id.
  ContentHash commitManifest(const Manifest &manifest);
  /// Release the assets of a committed manifest and delete its record.
  void dropManifest(const ContentHash &manifestId);

  Asset loadAsset(const ContentHash &id, const std::string &path = {}) const;
  /// Assets of a committed manifest, each carrying its entry's path.
  std::vector<Asset> loadManifestAssets(const ContentHash &manifestId) const;
  Manifest loadManifest(const ContentHash &id) const;

  DiffResult diffAssets(const Asset &oldAsset, const Asset &newAsset) const;

  void materialize(const Asset &asset, const ByteSink &sink,
                   std::stop_token stop = {}) const;
  uint64_t materializeRange(const Asset &asset, uint64_t offset,
                            uint64_t length, const ByteSink &sink,
                            std::stop_token stop = {}) const;
  void exportAsset(const Asset &asset, const std::string &destination,
                   std::stop_token stop = {}) const;

  ChunkStore::GCStats gc(bool dryRun = false);
  ChunkStore::VerifyReport verifyStore();
  std::vector<ChunkStore::TierTransition> applyLifecyclePolicy();
  void checkpoint();

  const EngineConfig &config() const { return config_; }
  const Chunker &chunker() const { return chunker_; }
  ChunkStore &chunkStore() { return *chunks_; }
  AssetStore &assetStore() { return *assets_; }

private:
  std::vector<ContentHash> retainDistinct(const std::vector<Chunk> &chunks);
  void releaseHashes(const std::vector<ContentHash> &hashes) noexcept;

  EngineConfig config_;
  Chunker chunker_;
  ManifestBuilder builder_;
  std::unique_ptr<ChunkStore> chunks_;
  std::unique_ptr<AssetStore> assets_;
  std::unique_ptr<Reconstructor> reconstructor_;
};

} // namespace dits

#endif // DITS_STORAGE_ENGINE_HPP
