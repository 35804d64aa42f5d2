#ifndef DITS_CHUNK_STORE_HPP
#define DITS_CHUNK_STORE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "storage/chunk_backend.hpp"
#include "storage/ref_log.hpp"
#include "utilities/config.hpp"
#include "utilities/digest.hpp"

namespace dits {

enum class StorageTier { Standard, Infrequent, Archived };

const char *storageTierName(StorageTier tier);
/// Throws ConfigError for an unknown name.
StorageTier parseStorageTier(const std::string &name);

enum class CompressionAlgorithm { None, Zstd };

/// Index record for one stored chunk.
struct ChunkEntry {
  uint64_t size{0};        ///< Plaintext length
  uint64_t stored_size{0}; ///< Bytes held by the backend
  CompressionAlgorithm compression{CompressionAlgorithm::None};
  StorageTier tier{StorageTier::Standard};
  uint64_t ref_count{0};
  /// When ref_count last dropped to zero.
  std::chrono::system_clock::time_point zero_since{};
  std::chrono::system_clock::time_point last_access{};
  /// Readers currently holding the chunk. Never persisted.
  uint32_t readers{0};
  /// GC is deleting the object outside the shard lock. Never persisted.
  bool collecting{false};
};

/**
 * @brief Content-addressed, reference-counted chunk storage.
 *
 * The index is split into StoreOptions::shards independently locked
 * shards selected by hash prefix. Chunk bytes live in a ChunkBackend and
 * are written before the index entry that points at them becomes
 * visible. When constructed with a RefLog path every mutation is journaled
 * and replayed, on top of the last checkpoint, by the next instance.
 */
class ChunkStore {
public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  struct GCStats {
    size_t totalChunks{0};
    size_t reclaimableChunks{0};
    uint64_t reclaimableBytes{0};
    size_t chunksRemoved{0};
    uint64_t bytesReclaimed{0};
    size_t failures{0};
  };

  struct TierTransition {
    ContentHash hash;
    StorageTier from;
    StorageTier to;
  };

  struct VerifyReport {
    size_t checked{0};
    std::vector<ContentHash> corrupt;
    std::vector<ContentHash> missing;
    /// Backend objects with no index entry.
    std::vector<std::string> orphaned;
    bool ok() const { return corrupt.empty() && missing.empty(); }
  };

  struct Stats {
    size_t chunks{0};
    size_t unreferenced{0};
    uint64_t logicalBytes{0};
    uint64_t storedBytes{0};
    uint64_t totalReferences{0};
    std::unordered_map<std::string, size_t> chunksPerTier;
  };

  /**
   * @param refLogPath Journal file; empty disables persistence.
   * @param snapshotPath Checkpoint file read before the journal is replayed.
   * @throw IoError, IntegrityError if recovery fails.
   */
  explicit ChunkStore(std::shared_ptr<ChunkBackend> backend,
                      StoreOptions options = {}, std::string refLogPath = {},
                      std::string snapshotPath = {});

  ChunkStore(const ChunkStore &) = delete;
  ChunkStore &operator=(const ChunkStore &) = delete;

  /**
   * @brief Store @p data if absent and take one reference to it.
   *
   * The bytes are durable in the backend before the reference is counted.
   * @return Hash of the plaintext.
   * @throw IoError if the backend write fails; no entry is created.
   */
  ContentHash put(std::span<const std::byte> data);

  /**
   * @brief Read and verify a chunk.
   *
   * Reading an Infrequent or Archived chunk moves it back to Standard.
   * @throw NotFoundError if unknown.
   * @throw IntegrityError if the stored bytes do not hash to @p hash.
   */
  std::vector<std::byte> get(const ContentHash &hash);

  bool contains(const ContentHash &hash) const;
  /// Zero when the chunk is unknown.
  uint64_t refCount(const ContentHash &hash) const;
  std::optional<ChunkEntry> entry(const ContentHash &hash) const;

  /// @throw NotFoundError if unknown.
  void incrementRef(const ContentHash &hash);
  /// @throw NotFoundError if unknown, IntegrityError if already zero.
  void decrementRef(const ContentHash &hash);

  /**
   * @brief Delete chunks with no references, no active readers and a
   * zero-reference age of at least StoreOptions::gc_grace.
   *
   * Candidates are marked under the shard lock and their objects are
   * deleted after it is released. Operations on a marked chunk wait until
   * its delete settles; other chunks in the shard are not held up. A chunk
   * that cannot be deleted is logged, counted in failures and left in
   * place.
   */
  GCStats gc(bool dryRun = false);

  /// @throw NotFoundError if unknown.
  void setTier(const ContentHash &hash, StorageTier tier);

  /// Demote chunks that have not been read within the policy thresholds.
  std::vector<TierTransition> applyLifecyclePolicy(const LifecyclePolicy &policy);

  /// Re-read and re-hash every chunk.
  VerifyReport verify();

  Stats stats() const;

  /// Write the index snapshot and truncate the journal.
  void checkpoint();

  /// Replace the time source. Intended for tests.
  void setClock(Clock clock);

  const StoreOptions &options() const { return options_; }
  ChunkBackend &backend() { return *backend_; }

private:
  using EntryMap = std::unordered_map<ContentHash, ChunkEntry>;

  struct Shard {
    mutable std::mutex mutex;
    /// Signalled when GC finishes with a collecting entry.
    std::condition_variable settled;
    EntryMap entries;
  };

  Shard &shardFor(const ContentHash &hash) const;
  /// Find @p hash, first waiting out a GC delete of it.
  static EntryMap::iterator findSettled(Shard &shard,
                                        std::unique_lock<std::mutex> &lock,
                                        const ContentHash &hash);
  std::chrono::system_clock::time_point now() const;
  void journal(const nlohmann::json &record);
  void recover();
  void applyRecord(const nlohmann::json &record);

  std::shared_ptr<ChunkBackend> backend_;
  StoreOptions options_;
  std::vector<std::unique_ptr<Shard>> shards_;
  std::unique_ptr<RefLog> refLog_;
  std::string refLogPath_;
  std::string snapshotPath_;
  Clock clock_;
};

} // namespace dits

#endif // DITS_CHUNK_STORE_HPP
