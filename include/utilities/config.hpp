#ifndef DITS_CONFIG_HPP
#define DITS_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "utilities/digest.hpp"
#include "utilities/logger.h"

namespace dits {

/// Width of the rolling-hash window in bytes.
inline constexpr uint32_t kRollingWindowSize = 48;

/**
 * @brief Chunk size bounds for content-defined chunking.
 *
 * Changing any of these values changes where boundaries fall, which breaks
 * deduplication against data chunked with the old values but never
 * correctness.
 */
struct ChunkerConfig {
  uint32_t min_size = 16 * 1024;
  uint32_t avg_size = 64 * 1024;
  uint32_t max_size = 256 * 1024;
  /// Maximum distance a boundary may move to land on a format hint.
  uint32_t hint_tolerance = 8 * 1024;

  static ChunkerConfig defaults() { return {}; }
  static ChunkerConfig small();
  static ChunkerConfig project();
  static ChunkerConfig media();
  static ChunkerConfig maxDedup();
  static ChunkerConfig fast();
  /// Preset for a file of @p size bytes.
  static ChunkerConfig forSize(uint64_t size);
  /// Look up a preset by name ("default", "small", ...). Throws ConfigError.
  static ChunkerConfig preset(const std::string &name);

  /// Boundary mask: avg_size rounded down to a power of two, minus one.
  uint64_t mask() const;

  /// Throws ConfigError when the bounds are inconsistent.
  void validate() const;

  bool operator==(const ChunkerConfig &o) const {
    return min_size == o.min_size && avg_size == o.avg_size &&
           max_size == o.max_size && hint_tolerance == o.hint_tolerance;
  }
};

struct StoreOptions {
  /// Number of independently locked index shards.
  size_t shards = 64;
  bool compress = true;
  int compression_level = 3;
  /// Time a zero-reference chunk is kept before GC may delete it.
  std::chrono::seconds gc_grace{3600};
  utils::HashAlgorithm hash_algorithm = utils::HashAlgorithm::BLAKE3;
};

/// Inactivity thresholds for demoting chunks to colder tiers.
struct LifecyclePolicy {
  std::chrono::hours infrequent_after{30 * 24};
  std::chrono::hours archive_after{180 * 24};
};

struct EngineConfig {
  ChunkerConfig chunker;
  StoreOptions store;
  LifecyclePolicy lifecycle;
  /// "filesystem" or "memory".
  std::string backend = "filesystem";
  /// Overrides DITS_VAR_DIR when non-empty.
  std::string var_dir;
  unsigned worker_threads = 4;
  LogLevel log_level = LogLevel::INFO;

  void validate() const;
};

/**
 * @brief Load configuration from YAML then apply environment overrides.
 *
 * The file is taken from @p path, else $DITS_CONFIG, else
 * "dits_config.yaml". A missing file yields defaults; an unreadable or
 * malformed one raises ConfigError.
 */
EngineConfig loadEngineConfig(const std::string &path = "");

/// Parse a YAML document held in memory. Throws ConfigError.
EngineConfig parseEngineConfig(const std::string &yaml);

/// Apply DITS_* environment overrides to @p cfg.
void applyEnvironmentOverrides(EngineConfig &cfg);

} // namespace dits

#endif // DITS_CONFIG_HPP
