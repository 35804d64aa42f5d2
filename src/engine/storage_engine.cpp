#include "engine/storage_engine.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <future>
#include <mutex>
#include <unordered_set>

namespace dits {

namespace {

std::vector<ContentHash> distinctHashes(const std::vector<Chunk> &chunks) {
  std::vector<ContentHash> hashes;
  std::unordered_set<ContentHash> seen;
  for (const auto &c : chunks) {
    if (seen.insert(c.hash).second)
      hashes.push_back(c.hash);
  }
  return hashes;
}

} // namespace

StorageEngine::StorageEngine(EngineConfig config)
    : config_(std::move(config)),
      chunker_(config_.chunker, config_.store.hash_algorithm),
      builder_(config_.store.hash_algorithm) {
  config_.validate();
  if (!config_.var_dir.empty())
    setVarDir(config_.var_dir);

  const auto algo = config_.store.hash_algorithm;
  if (config_.backend == "memory") {
    chunks_ = std::make_unique<ChunkStore>(
        std::make_shared<MemoryChunkBackend>(), config_.store);
    assets_ = AssetStore::inMemory(algo);
  } else {
    chunks_ = std::make_unique<ChunkStore>(
        std::make_shared<FilesystemChunkBackend>(chunksDir()), config_.store,
        refLogPath(), indexSnapshotPath());
    assets_ = AssetStore::openDirectories(assetsDir(), blobsDir(),
                                          manifestsDir(), algo);
  }
  reconstructor_ = std::make_unique<Reconstructor>(*chunks_);

  Logger::getInstance().log(
      LogLevel::INFO,
      "Opened " + config_.backend + " repository" +
          (config_.backend == "memory" ? std::string()
                                       : " at " + getVarDir()) +
          " (chunks " + std::to_string(config_.chunker.min_size) + "/" +
          std::to_string(config_.chunker.avg_size) + "/" +
          std::to_string(config_.chunker.max_size) + ", " +
          utils::hashAlgorithmName(algo) + ")");
}

void StorageEngine::releaseHashes(
    const std::vector<ContentHash> &hashes) noexcept {
  for (const auto &h : hashes) {
    try {
      chunks_->decrementRef(h);
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                "Could not release chunk " + h.toHex() +
                                    ": " + e.what());
    }
  }
}

std::vector<ContentHash>
StorageEngine::retainDistinct(const std::vector<Chunk> &chunks) {
  std::vector<ContentHash> taken;
  try {
    for (const auto &h : distinctHashes(chunks)) {
      chunks_->incrementRef(h);
      taken.push_back(h);
    }
  } catch (...) {
    releaseHashes(taken);
    throw;
  }
  return taken;
}

Asset StorageEngine::chunkAndStore(const std::string &path, std::istream &in,
                                   std::vector<std::byte> metadata,
                                   const HintProvider &hints,
                                   std::stop_token stop) {
  std::vector<uint64_t> hintOffsets;
  if (hints) {
    const std::streampos start = in.tellg();
    if (start == std::streampos(-1))
      throwIoError("hint providers need a seekable stream", path);
    hintOffsets = normalizeHints(hints(in));
    in.clear();
    in.seekg(start);
    if (!in)
      throwIoError("cannot rewind stream after hint scan", path);
  }

  std::vector<Chunk> chunks;
  std::vector<ContentHash> taken;
  std::unordered_set<ContentHash> seen;
  try {
    chunker_.forEachChunk(
        in,
        [&](const Chunk &c, std::span<const std::byte> bytes) {
          chunks.push_back(c);
          if (!seen.insert(c.hash).second)
            return;
          taken.push_back(chunks_->put(bytes));
        },
        hintOffsets, stop);

    Asset asset = builder_.build(path, std::move(metadata), std::move(chunks));
    assets_->saveAsset(asset);
    Logger::getInstance().log(LogLevel::INFO,
                              "Added " + path + ": " +
                                  std::to_string(asset.size) + " bytes, " +
                                  std::to_string(asset.chunks.size()) +
                                  " chunks (" + std::to_string(taken.size()) +
                                  " distinct), asset " + asset.id.shortHex());
    return asset;
  } catch (...) {
    releaseHashes(taken);
    throw;
  }
}

Asset StorageEngine::addFile(const std::string &fsPath,
                             const std::string &logicalPath,
                             const HintProvider &hints, std::stop_token stop) {
  std::ifstream in(fsPath, std::ios::binary);
  if (!in.is_open())
    throwIoError("cannot open for reading", fsPath);
  try {
    return chunkAndStore(logicalPath.empty() ? fsPath : logicalPath, in, {},
                         hints, stop);
  } catch (const IoError &e) {
    if (!e.path().empty())
      throw;
    throw IoError(e.what(), fsPath);
  }
}

std::vector<Asset>
StorageEngine::addFiles(const std::vector<std::string> &fsPaths,
                        const HintProvider &hints) {
  std::vector<Asset> results(fsPaths.size());
  std::vector<char> done(fsPaths.size(), 0);
  std::atomic<size_t> next{0};
  std::stop_source cancel;
  std::mutex errorMutex;
  std::exception_ptr firstError;

  auto worker = [&] {
    for (size_t i = next++; i < fsPaths.size(); i = next++) {
      if (cancel.stop_requested())
        return;
      try {
        results[i] = addFile(fsPaths[i], {}, hints, cancel.get_token());
        done[i] = 1;
      } catch (...) {
        std::lock_guard<std::mutex> lock(errorMutex);
        if (!firstError)
          firstError = std::current_exception();
        cancel.request_stop();
      }
    }
  };

  const size_t threads = std::max<size_t>(
      1, std::min<size_t>(config_.worker_threads, fsPaths.size()));
  std::vector<std::future<void>> futures;
  futures.reserve(threads);
  for (size_t t = 0; t < threads; ++t)
    futures.push_back(std::async(std::launch::async, worker));
  for (auto &f : futures)
    f.get();

  if (firstError) {
    for (size_t i = 0; i < results.size(); ++i) {
      if (done[i])
        releaseHashes(distinctHashes(results[i].chunks));
    }
    std::rethrow_exception(firstError);
  }
  return results;
}

void StorageEngine::retainAsset(const Asset &asset) {
  retainDistinct(asset.chunks);
}

void StorageEngine::releaseAsset(const Asset &asset) {
  std::vector<ContentHash> released;
  try {
    for (const auto &h : distinctHashes(asset.chunks)) {
      chunks_->decrementRef(h);
      released.push_back(h);
    }
  } catch (...) {
    for (const auto &h : released) {
      try {
        chunks_->incrementRef(h);
      } catch (const std::exception &e) {
        Logger::getInstance().log(LogLevel::ERROR,
                                  "Could not restore reference to " +
                                      h.toHex() + ": " + e.what());
      }
    }
    throw;
  }
}

Asset StorageEngine::updateMetadata(const Asset &asset,
                                    std::vector<std::byte> metadata) {
  Asset updated = builder_.withMetadata(asset, std::move(metadata));
  std::vector<ContentHash> taken = retainDistinct(updated.chunks);
  try {
    assets_->saveAsset(updated);
  } catch (...) {
    releaseHashes(taken);
    throw;
  }
  return updated;
}

ContentHash StorageEngine::commitManifest(const Manifest &manifest) {
  const ContentHash id = manifest.id(config_.store.hash_algorithm);
  if (assets_->hasManifest(id))
    return id;

  std::vector<std::vector<ContentHash>> retained;
  try {
    for (const auto &entry : manifest.entries()) {
      const Asset asset = assets_->loadAsset(entry.second, entry.first);
      retained.push_back(retainDistinct(asset.chunks));
    }
    assets_->saveManifest(manifest);
  } catch (...) {
    for (const auto &hashes : retained)
      releaseHashes(hashes);
    throw;
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "Committed manifest " + id.shortHex() + " with " +
                                std::to_string(manifest.size()) + " assets");
  return id;
}

void StorageEngine::dropManifest(const ContentHash &manifestId) {
  const std::vector<Asset> assets = loadManifestAssets(manifestId);

  std::vector<const Asset *> released;
  try {
    for (const auto &asset : assets) {
      releaseAsset(asset);
      released.push_back(&asset);
    }
    assets_->removeManifest(manifestId);
  } catch (...) {
    for (const Asset *asset : released) {
      try {
        retainAsset(*asset);
      } catch (const std::exception &e) {
        Logger::getInstance().log(LogLevel::ERROR,
                                  "Could not restore references of asset " +
                                      asset->id.toHex() + ": " + e.what());
      }
    }
    throw;
  }
  Logger::getInstance().log(LogLevel::INFO,
                            "Dropped manifest " + manifestId.shortHex());
}

Asset StorageEngine::loadAsset(const ContentHash &id,
                               const std::string &path) const {
  return assets_->loadAsset(id, path);
}

std::vector<Asset>
StorageEngine::loadManifestAssets(const ContentHash &manifestId) const {
  const Manifest manifest = assets_->loadManifest(manifestId);
  std::vector<Asset> assets;
  assets.reserve(manifest.size());
  for (const auto &entry : manifest.entries())
    assets.push_back(assets_->loadAsset(entry.second, entry.first));
  return assets;
}

Manifest StorageEngine::loadManifest(const ContentHash &id) const {
  return assets_->loadManifest(id);
}

DiffResult StorageEngine::diffAssets(const Asset &oldAsset,
                                     const Asset &newAsset) const {
  return DiffEngine::diffAssets(oldAsset, newAsset);
}

void StorageEngine::materialize(const Asset &asset, const ByteSink &sink,
                                std::stop_token stop) const {
  reconstructor_->reconstruct(asset, sink, stop);
}

uint64_t StorageEngine::materializeRange(const Asset &asset, uint64_t offset,
                                         uint64_t length, const ByteSink &sink,
                                         std::stop_token stop) const {
  return reconstructor_->reconstructRange(asset, offset, length, sink, stop);
}

void StorageEngine::exportAsset(const Asset &asset,
                                const std::string &destination,
                                std::stop_token stop) const {
  reconstructor_->exportToFile(asset, destination, stop);
}

ChunkStore::GCStats StorageEngine::gc(bool dryRun) {
  return chunks_->gc(dryRun);
}

ChunkStore::VerifyReport StorageEngine::verifyStore() {
  return chunks_->verify();
}

std::vector<ChunkStore::TierTransition> StorageEngine::applyLifecyclePolicy() {
  return chunks_->applyLifecyclePolicy(config_.lifecycle);
}

void StorageEngine::checkpoint() { chunks_->checkpoint(); }

} // namespace dits
