#include "utilities/config.hpp"
#include "utilities/errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

namespace dits {

ChunkerConfig ChunkerConfig::small() {
  return {1024, 4 * 1024, 16 * 1024, 1024};
}

ChunkerConfig ChunkerConfig::project() {
  return {4 * 1024, 16 * 1024, 64 * 1024, 2 * 1024};
}

ChunkerConfig ChunkerConfig::media() {
  return {64 * 1024, 256 * 1024, 1024 * 1024, 32 * 1024};
}

ChunkerConfig ChunkerConfig::maxDedup() {
  return {2 * 1024, 8 * 1024, 32 * 1024, 1024};
}

ChunkerConfig ChunkerConfig::fast() {
  return {256 * 1024, 1024 * 1024, 4 * 1024 * 1024, 128 * 1024};
}

ChunkerConfig ChunkerConfig::forSize(uint64_t size) {
  if (size <= 64 * 1024)
    return project();
  if (size <= 10 * 1024 * 1024)
    return defaults();
  return media();
}

ChunkerConfig ChunkerConfig::preset(const std::string &name) {
  if (name == "default")
    return defaults();
  if (name == "small")
    return small();
  if (name == "project")
    return project();
  if (name == "media")
    return media();
  if (name == "max_dedup")
    return maxDedup();
  if (name == "fast")
    return fast();
  throwConfigError("unknown chunker preset '" + name + "'");
}

uint64_t ChunkerConfig::mask() const {
  uint64_t p = 1;
  while ((p << 1) <= avg_size)
    p <<= 1;
  return p - 1;
}

void ChunkerConfig::validate() const {
  if (min_size == 0)
    throwConfigError("min_size must be greater than zero");
  if (min_size < kRollingWindowSize)
    throwConfigError("min_size (" + std::to_string(min_size) +
                     ") is smaller than the rolling window (" +
                     std::to_string(kRollingWindowSize) + ")");
  if (min_size >= max_size)
    throwConfigError("min_size (" + std::to_string(min_size) +
                     ") must be less than max_size (" +
                     std::to_string(max_size) + ")");
  if (avg_size < min_size || avg_size > max_size)
    throwConfigError("avg_size (" + std::to_string(avg_size) +
                     ") must lie within [min_size, max_size]");
}

void EngineConfig::validate() const {
  chunker.validate();
  if (store.shards == 0)
    throwConfigError("store.shards must be greater than zero");
  if (store.compression_level < 1 || store.compression_level > 22)
    throwConfigError("store.compression_level must be within 1..22");
  if (store.gc_grace.count() < 0)
    throwConfigError("store.gc_grace_seconds must not be negative");
  if (lifecycle.archive_after < lifecycle.infrequent_after)
    throwConfigError(
        "lifecycle.archive_after_days must not be below infrequent_after_days");
  if (backend != "filesystem" && backend != "memory")
    throwConfigError("unknown store backend '" + backend + "'");
  if (worker_threads == 0)
    throwConfigError("worker_threads must be greater than zero");
}

static void applyNode(const YAML::Node &root, EngineConfig &cfg) {
  if (const auto chunker = root["chunker"]) {
    if (chunker["preset"])
      cfg.chunker = ChunkerConfig::preset(chunker["preset"].as<std::string>());
    if (chunker["min_size"])
      cfg.chunker.min_size = chunker["min_size"].as<uint32_t>();
    if (chunker["avg_size"])
      cfg.chunker.avg_size = chunker["avg_size"].as<uint32_t>();
    if (chunker["max_size"])
      cfg.chunker.max_size = chunker["max_size"].as<uint32_t>();
    if (chunker["hint_tolerance"])
      cfg.chunker.hint_tolerance = chunker["hint_tolerance"].as<uint32_t>();
  }
  if (root["hash_algorithm"])
    cfg.store.hash_algorithm =
        utils::parseHashAlgorithm(root["hash_algorithm"].as<std::string>());
  if (const auto store = root["store"]) {
    if (store["shards"])
      cfg.store.shards = store["shards"].as<size_t>();
    if (store["compress"])
      cfg.store.compress = store["compress"].as<bool>();
    if (store["compression_level"])
      cfg.store.compression_level = store["compression_level"].as<int>();
    if (store["gc_grace_seconds"])
      cfg.store.gc_grace =
          std::chrono::seconds(store["gc_grace_seconds"].as<long long>());
    if (store["backend"])
      cfg.backend = store["backend"].as<std::string>();
  }
  if (const auto lifecycle = root["lifecycle"]) {
    if (lifecycle["infrequent_after_days"])
      cfg.lifecycle.infrequent_after =
          std::chrono::hours(24 * lifecycle["infrequent_after_days"].as<int>());
    if (lifecycle["archive_after_days"])
      cfg.lifecycle.archive_after =
          std::chrono::hours(24 * lifecycle["archive_after_days"].as<int>());
  }
  if (root["var_dir"])
    cfg.var_dir = root["var_dir"].as<std::string>();
  if (root["worker_threads"])
    cfg.worker_threads = root["worker_threads"].as<unsigned>();
  if (root["log_level"])
    cfg.log_level = parseLogLevel(root["log_level"].as<std::string>());
}

EngineConfig parseEngineConfig(const std::string &yaml) {
  EngineConfig cfg;
  try {
    YAML::Node root = YAML::Load(yaml);
    if (root.IsDefined() && !root.IsNull())
      applyNode(root, cfg);
  } catch (const YAML::Exception &e) {
    throwConfigError(std::string("YAML: ") + e.what());
  }
  return cfg;
}

static uint32_t envU32(const char *name, uint32_t fallback) {
  const char *env = std::getenv(name);
  if (!env || env[0] == '\0')
    return fallback;
  const std::string text(env);
  // stoull accepts "-1" and wraps it.
  if (text.find('-') != std::string::npos)
    throwConfigError(std::string(name) + " must not be negative: " + text);
  unsigned long long v = 0;
  size_t used = 0;
  try {
    v = std::stoull(text, &used);
  } catch (const std::invalid_argument &) {
    throwConfigError(std::string(name) + " is not a number: " + text);
  } catch (const std::out_of_range &) {
    throwConfigError(std::string(name) + " is out of range: " + text);
  }
  if (used != text.size())
    throwConfigError(std::string(name) + " is not a number: " + text);
  if (v > std::numeric_limits<uint32_t>::max())
    throwConfigError(std::string(name) + " is out of range: " + text);
  return static_cast<uint32_t>(v);
}

void applyEnvironmentOverrides(EngineConfig &cfg) {
  cfg.chunker.min_size = envU32("DITS_MIN_CHUNK", cfg.chunker.min_size);
  cfg.chunker.avg_size = envU32("DITS_AVG_CHUNK", cfg.chunker.avg_size);
  cfg.chunker.max_size = envU32("DITS_MAX_CHUNK", cfg.chunker.max_size);
  if (const char *env = std::getenv("DITS_HASH"))
    cfg.store.hash_algorithm = utils::parseHashAlgorithm(env);
  cfg.store.compression_level = static_cast<int>(
      envU32("DITS_COMPRESSION_LEVEL",
             static_cast<uint32_t>(cfg.store.compression_level)));
  cfg.store.gc_grace = std::chrono::seconds(envU32(
      "DITS_GC_GRACE_SECONDS", static_cast<uint32_t>(cfg.store.gc_grace.count())));
  if (const char *env = std::getenv("DITS_VAR_DIR"); env && env[0] != '\0')
    cfg.var_dir = env;
}

EngineConfig loadEngineConfig(const std::string &path) {
  std::string file = path;
  if (file.empty()) {
    const char *env = std::getenv("DITS_CONFIG");
    file = env ? env : "dits_config.yaml";
  }

  EngineConfig cfg;
  std::error_code ec;
  if (std::filesystem::exists(file, ec)) {
    try {
      YAML::Node root = YAML::LoadFile(file);
      if (root.IsDefined() && !root.IsNull())
        applyNode(root, cfg);
    } catch (const YAML::Exception &e) {
      throwConfigError(file + ": " + e.what());
    }
  } else if (!path.empty()) {
    throwConfigError("configuration file not found: " + file);
  }
  applyEnvironmentOverrides(cfg);
  cfg.validate();
  return cfg;
}

} // namespace dits
