#include "storage/chunk_store.hpp"
#include "utilities/blockio.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <filesystem>
#include <unordered_set>

namespace dits {

namespace {

using TimePoint = std::chrono::system_clock::time_point;

int64_t toMillis(TimePoint t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             t.time_since_epoch())
      .count();
}

TimePoint fromMillis(int64_t ms) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
      std::chrono::milliseconds(ms)));
}

const char *compressionName(CompressionAlgorithm c) {
  return c == CompressionAlgorithm::Zstd ? "zstd" : "none";
}

nlohmann::json entryRecord(const ContentHash &hash, const ChunkEntry &e) {
  return {{"op", "set"},
          {"hash", hash.toHex()},
          {"size", e.size},
          {"stored_size", e.stored_size},
          {"compression", compressionName(e.compression)},
          {"tier", storageTierName(e.tier)},
          {"ref_count", e.ref_count},
          {"zero_since", toMillis(e.zero_since)},
          {"last_access", toMillis(e.last_access)}};
}

nlohmann::json eraseRecord(const ContentHash &hash) {
  return {{"op", "erase"}, {"hash", hash.toHex()}};
}

} // namespace

const char *storageTierName(StorageTier tier) {
  switch (tier) {
  case StorageTier::Standard:
    return "standard";
  case StorageTier::Infrequent:
    return "infrequent";
  case StorageTier::Archived:
    return "archived";
  }
  return "standard";
}

StorageTier parseStorageTier(const std::string &name) {
  if (name == "standard")
    return StorageTier::Standard;
  if (name == "infrequent")
    return StorageTier::Infrequent;
  if (name == "archived")
    return StorageTier::Archived;
  throwConfigError("unknown storage tier '" + name + "'");
}

ChunkStore::ChunkStore(std::shared_ptr<ChunkBackend> backend,
                       StoreOptions options, std::string refLogPath,
                       std::string snapshotPath)
    : backend_(std::move(backend)), options_(options),
      refLogPath_(std::move(refLogPath)),
      snapshotPath_(std::move(snapshotPath)),
      clock_([] { return std::chrono::system_clock::now(); }) {
  if (!backend_)
    throwConfigError("chunk store requires a backend");
  if (options_.shards == 0)
    throwConfigError("store.shards must be at least 1");
  shards_.reserve(options_.shards);
  for (size_t i = 0; i < options_.shards; ++i)
    shards_.push_back(std::make_unique<Shard>());

  if (!refLogPath_.empty()) {
    recover();
    refLog_ = std::make_unique<RefLog>(refLogPath_);
  }
}

ChunkStore::Shard &ChunkStore::shardFor(const ContentHash &hash) const {
  const size_t prefix = (static_cast<size_t>(hash.bytes[0]) << 8) |
                        static_cast<size_t>(hash.bytes[1]);
  return *shards_[prefix % shards_.size()];
}

ChunkStore::EntryMap::iterator
ChunkStore::findSettled(Shard &shard, std::unique_lock<std::mutex> &lock,
                        const ContentHash &hash) {
  auto it = shard.entries.find(hash);
  while (it != shard.entries.end() && it->second.collecting) {
    shard.settled.wait(lock);
    it = shard.entries.find(hash);
  }
  return it;
}

TimePoint ChunkStore::now() const { return clock_(); }

void ChunkStore::setClock(Clock clock) { clock_ = std::move(clock); }

void ChunkStore::journal(const nlohmann::json &record) {
  if (refLog_)
    refLog_->append(record);
}

ContentHash ChunkStore::put(std::span<const std::byte> data) {
  const ContentHash hash = BlockIO::hash(data, options_.hash_algorithm);
  const std::string key = hash.toHex();
  Shard &shard = shardFor(hash);

  auto addReference = [this, &hash](ChunkEntry &e) {
    ChunkEntry updated = e;
    if (updated.ref_count == 0)
      updated.zero_since = {};
    ++updated.ref_count;
    updated.last_access = now();
    journal(entryRecord(hash, updated));
    e = updated;
    MetricsRegistry::instance().incrementCounter(
        "dits_chunks_deduplicated_total");
  };

  {
    std::unique_lock<std::mutex> lock(shard.mutex);
    auto it = findSettled(shard, lock, hash);
    if (it != shard.entries.end()) {
      addReference(it->second);
      return hash;
    }
  }

  // Encode outside the lock.
  std::vector<std::byte> stored(data.begin(), data.end());
  CompressionAlgorithm codec = CompressionAlgorithm::None;
  if (options_.compress && !stored.empty()) {
    BlockIO io(options_.compression_level, options_.hash_algorithm);
    std::vector<std::byte> frame = io.compress_data(stored);
    if (frame.size() < stored.size()) {
      stored = std::move(frame);
      codec = CompressionAlgorithm::Zstd;
    }
  }

  std::unique_lock<std::mutex> lock(shard.mutex);
  auto it = findSettled(shard, lock, hash);
  if (it != shard.entries.end()) {
    addReference(it->second);
    return hash;
  }

  try {
    backend_->write(key, stored);
  } catch (const DitsError &) {
    throw;
  } catch (const std::exception &e) {
    throwIoError(std::string("backend write failed: ") + e.what(), key);
  }

  ChunkEntry entry;
  entry.size = data.size();
  entry.stored_size = stored.size();
  entry.compression = codec;
  entry.ref_count = 1;
  entry.last_access = now();
  try {
    journal(entryRecord(hash, entry));
  } catch (const DitsError &) {
    try {
      backend_->remove(key);
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Could not remove unjournaled chunk " + key +
                                    ": " + e.what());
    }
    throw;
  }
  shard.entries.emplace(hash, entry);

  auto &metrics = MetricsRegistry::instance();
  metrics.incrementCounter("dits_chunks_stored_total");
  metrics.incrementCounter("dits_bytes_stored_total",
                           static_cast<double>(stored.size()));
  Logger::getInstance().log(LogLevel::TRACE,
                            "Stored chunk " + hash.shortHex() + " (" +
                                std::to_string(entry.size) + " -> " +
                                std::to_string(entry.stored_size) + " bytes)");
  return hash;
}

namespace {

// Load and check the stored form of @p hash described by @p entry.
std::vector<std::byte> readVerified(const ChunkBackend &backend,
                                    const ContentHash &hash,
                                    const ChunkEntry &entry,
                                    const StoreOptions &options) {
  const std::string key = hash.toHex();
  std::vector<std::byte> stored = backend.read(key);
  if (stored.size() != entry.stored_size)
    throwIntegrityError("stored size " + std::to_string(stored.size()) +
                            " differs from indexed size " +
                            std::to_string(entry.stored_size),
                        key);

  std::vector<std::byte> plain;
  if (entry.compression == CompressionAlgorithm::Zstd) {
    BlockIO io(options.compression_level, options.hash_algorithm);
    try {
      plain = io.decompress_data(stored, entry.size);
    } catch (const std::runtime_error &e) {
      throwIntegrityError(std::string("undecodable chunk: ") + e.what(), key);
    }
  } else {
    plain = std::move(stored);
  }

  if (plain.size() != entry.size ||
      BlockIO::hash(plain, options.hash_algorithm) != hash)
    throwIntegrityError("chunk content does not match its hash", key);
  return plain;
}

} // namespace

std::vector<std::byte> ChunkStore::get(const ContentHash &hash) {
  Shard &shard = shardFor(hash);
  ChunkEntry pinned;
  {
    std::unique_lock<std::mutex> lock(shard.mutex);
    auto it = findSettled(shard, lock, hash);
    if (it == shard.entries.end())
      throw NotFoundError(hash.toHex());
    ++it->second.readers;
    pinned = it->second;
  }

  auto release = [this, &shard, &hash](bool succeeded) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.entries.find(hash);
    if (it == shard.entries.end())
      return;
    --it->second.readers;
    if (!succeeded)
      return;
    it->second.last_access = now();
    if (it->second.tier != StorageTier::Standard) {
      Logger::getInstance().log(LogLevel::DEBUG,
                                "Promoting chunk " + hash.shortHex() +
                                    " from " +
                                    storageTierName(it->second.tier));
      it->second.tier = StorageTier::Standard;
      journal(entryRecord(hash, it->second));
    }
  };

  std::vector<std::byte> plain;
  try {
    plain = readVerified(*backend_, hash, pinned, options_);
  } catch (...) {
    release(false);
    throw;
  }
  release(true);
  return plain;
}

bool ChunkStore::contains(const ContentHash &hash) const {
  Shard &shard = shardFor(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  return shard.entries.count(hash) > 0;
}

uint64_t ChunkStore::refCount(const ContentHash &hash) const {
  Shard &shard = shardFor(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(hash);
  return it == shard.entries.end() ? 0 : it->second.ref_count;
}

std::optional<ChunkEntry> ChunkStore::entry(const ContentHash &hash) const {
  Shard &shard = shardFor(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(hash);
  if (it == shard.entries.end())
    return std::nullopt;
  return it->second;
}

void ChunkStore::incrementRef(const ContentHash &hash) {
  Shard &shard = shardFor(hash);
  std::unique_lock<std::mutex> lock(shard.mutex);
  auto it = findSettled(shard, lock, hash);
  if (it == shard.entries.end())
    throwNotFound(hash.toHex());
  ChunkEntry updated = it->second;
  if (updated.ref_count == 0)
    updated.zero_since = {};
  ++updated.ref_count;
  journal(entryRecord(hash, updated));
  it->second = updated;
}

void ChunkStore::decrementRef(const ContentHash &hash) {
  Shard &shard = shardFor(hash);
  std::unique_lock<std::mutex> lock(shard.mutex);
  auto it = findSettled(shard, lock, hash);
  if (it == shard.entries.end())
    throwNotFound(hash.toHex());
  if (it->second.ref_count == 0)
    throwIntegrityError("reference count underflow", hash.toHex());
  ChunkEntry updated = it->second;
  if (--updated.ref_count == 0)
    updated.zero_since = now();
  journal(entryRecord(hash, updated));
  it->second = updated;
}

ChunkStore::GCStats ChunkStore::gc(bool dryRun) {
  GCStats stats;
  const TimePoint t = now();
  for (auto &shardPtr : shards_) {
    Shard &shard = *shardPtr;
    std::vector<std::pair<ContentHash, uint64_t>> candidates;
    {
      std::lock_guard<std::mutex> lock(shard.mutex);
      stats.totalChunks += shard.entries.size();
      for (auto &kv : shard.entries) {
        ChunkEntry &e = kv.second;
        if (e.ref_count != 0 || e.readers != 0 || e.collecting ||
            t - e.zero_since < options_.gc_grace)
          continue;
        ++stats.reclaimableChunks;
        stats.reclaimableBytes += e.stored_size;
        if (dryRun)
          continue;
        e.collecting = true;
        candidates.emplace_back(kv.first, e.stored_size);
      }
    }
    if (candidates.empty())
      continue;

    // Backend deletes run without the shard lock.
    std::vector<bool> removed(candidates.size(), false);
    for (size_t i = 0; i < candidates.size(); ++i) {
      const std::string key = candidates[i].first.toHex();
      try {
        backend_->remove(key);
        removed[i] = true;
      } catch (const std::exception &ex) {
        Logger::getInstance().log(LogLevel::WARN, "GC could not delete chunk " +
                                                      key + ": " + ex.what());
        ++stats.failures;
      }
    }

    {
      std::lock_guard<std::mutex> lock(shard.mutex);
      for (size_t i = 0; i < candidates.size(); ++i) {
        const ContentHash &hash = candidates[i].first;
        auto it = shard.entries.find(hash);
        if (it == shard.entries.end())
          continue;
        if (!removed[i]) {
          it->second.collecting = false;
          continue;
        }
        shard.entries.erase(it);
        ++stats.chunksRemoved;
        stats.bytesReclaimed += candidates[i].second;
        try {
          journal(eraseRecord(hash));
        } catch (const DitsError &ex) {
          // Recovery drops index entries whose object is gone.
          Logger::getInstance().log(LogLevel::WARN,
                                    "GC could not journal removal of " +
                                        hash.toHex() + ": " + ex.what());
        }
      }
    }
    shard.settled.notify_all();
  }

  if (!dryRun) {
    auto &metrics = MetricsRegistry::instance();
    metrics.incrementCounter("dits_gc_chunks_removed_total",
                             static_cast<double>(stats.chunksRemoved));
    metrics.incrementCounter("dits_gc_bytes_reclaimed_total",
                             static_cast<double>(stats.bytesReclaimed));
  }
  Logger::getInstance().log(
      LogLevel::INFO,
      std::string(dryRun ? "GC dry run: " : "GC: ") +
          std::to_string(stats.reclaimableChunks) + " of " +
          std::to_string(stats.totalChunks) + " chunks reclaimable, " +
          std::to_string(stats.chunksRemoved) + " removed, " +
          std::to_string(stats.failures) + " failed");
  return stats;
}

void ChunkStore::setTier(const ContentHash &hash, StorageTier tier) {
  Shard &shard = shardFor(hash);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.entries.find(hash);
  if (it == shard.entries.end())
    throwNotFound(hash.toHex());
  if (it->second.tier == tier)
    return;
  ChunkEntry updated = it->second;
  updated.tier = tier;
  journal(entryRecord(hash, updated));
  it->second = updated;
}

std::vector<ChunkStore::TierTransition>
ChunkStore::applyLifecyclePolicy(const LifecyclePolicy &policy) {
  std::vector<TierTransition> transitions;
  const TimePoint t = now();
  for (auto &shardPtr : shards_) {
    Shard &shard = *shardPtr;
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (auto &kv : shard.entries) {
      ChunkEntry &e = kv.second;
      const auto idle = t - e.last_access;
      StorageTier target = StorageTier::Standard;
      if (idle >= policy.archive_after)
        target = StorageTier::Archived;
      else if (idle >= policy.infrequent_after)
        target = StorageTier::Infrequent;
      if (static_cast<int>(target) <= static_cast<int>(e.tier))
        continue;
      ChunkEntry updated = e;
      updated.tier = target;
      journal(entryRecord(kv.first, updated));
      transitions.push_back({kv.first, e.tier, target});
      e = updated;
    }
  }
  if (!transitions.empty())
    Logger::getInstance().log(LogLevel::INFO,
                              "Lifecycle policy moved " +
                                  std::to_string(transitions.size()) +
                                  " chunks to colder tiers");
  return transitions;
}

ChunkStore::VerifyReport ChunkStore::verify() {
  VerifyReport report;
  std::vector<std::pair<ContentHash, ChunkEntry>> snapshot;
  std::unordered_set<std::string> indexed;
  for (auto &shardPtr : shards_) {
    std::lock_guard<std::mutex> lock(shardPtr->mutex);
    for (const auto &kv : shardPtr->entries) {
      indexed.insert(kv.first.toHex());
      if (!kv.second.collecting)
        snapshot.emplace_back(kv.first, kv.second);
    }
  }

  for (const auto &[hash, e] : snapshot) {
    ++report.checked;
    try {
      readVerified(*backend_, hash, e, options_);
    } catch (const NotFoundError &) {
      if (contains(hash))
        report.missing.push_back(hash);
    } catch (const IntegrityError &) {
      report.corrupt.push_back(hash);
    }
  }

  for (const auto &key : backend_->list()) {
    if (!indexed.count(key))
      report.orphaned.push_back(key);
  }

  Logger::getInstance().log(
      report.ok() ? LogLevel::INFO : LogLevel::ERROR,
      "Verified " + std::to_string(report.checked) + " chunks: " +
          std::to_string(report.corrupt.size()) + " corrupt, " +
          std::to_string(report.missing.size()) + " missing, " +
          std::to_string(report.orphaned.size()) + " orphaned");
  return report;
}

ChunkStore::Stats ChunkStore::stats() const {
  Stats s;
  for (const auto &shardPtr : shards_) {
    std::lock_guard<std::mutex> lock(shardPtr->mutex);
    for (const auto &kv : shardPtr->entries) {
      const ChunkEntry &e = kv.second;
      ++s.chunks;
      if (e.ref_count == 0)
        ++s.unreferenced;
      s.logicalBytes += e.size;
      s.storedBytes += e.stored_size;
      s.totalReferences += e.ref_count;
      ++s.chunksPerTier[storageTierName(e.tier)];
    }
  }
  return s;
}

void ChunkStore::checkpoint() {
  if (!refLog_)
    return;
  // Holding every shard lock keeps the journal quiet while it is truncated.
  std::vector<std::unique_lock<std::mutex>> locks;
  locks.reserve(shards_.size());
  for (auto &shardPtr : shards_)
    locks.emplace_back(shardPtr->mutex);

  nlohmann::json entries = nlohmann::json::array();
  for (auto &shardPtr : shards_) {
    for (const auto &kv : shardPtr->entries)
      entries.push_back(entryRecord(kv.first, kv.second));
  }
  const size_t count = entries.size();
  writeJsonFile(snapshotPath_,
                {{"version", 1}, {"entries", std::move(entries)}});
  refLog_->truncate();
  Logger::getInstance().log(LogLevel::INFO,
                            "Checkpointed " + std::to_string(count) +
                                " index entries to " + snapshotPath_);
}

void ChunkStore::applyRecord(const nlohmann::json &record) {
  try {
    const std::string op = record.at("op").get<std::string>();
    const ContentHash hash =
        ContentHash::fromHex(record.at("hash").get<std::string>());
    Shard &shard = shardFor(hash);
    if (op == "erase") {
      shard.entries.erase(hash);
      return;
    }
    if (op != "set")
      throwIntegrityError("unknown index record '" + op + "'", hash.toHex());

    ChunkEntry e;
    e.size = record.at("size").get<uint64_t>();
    e.stored_size = record.at("stored_size").get<uint64_t>();
    e.compression = record.at("compression").get<std::string>() == "zstd"
                        ? CompressionAlgorithm::Zstd
                        : CompressionAlgorithm::None;
    e.tier = parseStorageTier(record.at("tier").get<std::string>());
    e.ref_count = record.at("ref_count").get<uint64_t>();
    e.zero_since = fromMillis(record.at("zero_since").get<int64_t>());
    e.last_access = fromMillis(record.at("last_access").get<int64_t>());
    shard.entries[hash] = e;
  } catch (const nlohmann::json::exception &e) {
    throwIntegrityError(std::string("malformed index record: ") + e.what());
  } catch (const ConfigError &e) {
    throwIntegrityError(std::string("malformed index record: ") + e.what());
  }
}

void ChunkStore::recover() {
  size_t fromSnapshot = 0;
  std::error_code ec;
  if (!snapshotPath_.empty() && std::filesystem::exists(snapshotPath_, ec)) {
    const nlohmann::json doc = readJsonFile(snapshotPath_);
    if (!doc.contains("entries") || !doc["entries"].is_array())
      throwIntegrityError("index snapshot has no entries array " +
                          snapshotPath_);
    for (const auto &record : doc["entries"]) {
      applyRecord(record);
      ++fromSnapshot;
    }
  }
  const size_t replayed = RefLog::replay(
      refLogPath_, [this](const nlohmann::json &r) { applyRecord(r); });

  size_t dropped = 0;
  for (auto &shardPtr : shards_) {
    for (auto it = shardPtr->entries.begin(); it != shardPtr->entries.end();) {
      if (backend_->exists(it->first.toHex())) {
        ++it;
        continue;
      }
      Logger::getInstance().log(LogLevel::WARN,
                                "Dropping index entry for missing chunk " +
                                    it->first.toHex());
      it = shardPtr->entries.erase(it);
      ++dropped;
    }
  }

  if (fromSnapshot || replayed || dropped)
    Logger::getInstance().log(
        LogLevel::INFO, "Recovered chunk index: " +
                            std::to_string(fromSnapshot) + " from snapshot, " +
                            std::to_string(replayed) + " journal records, " +
                            std::to_string(dropped) + " dropped");
}

} // namespace dits
