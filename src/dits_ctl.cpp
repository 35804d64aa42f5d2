#include "engine/storage_engine.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace dits;

static void usage() {
  std::cout
      << "Usage: dits_ctl [--config <file>] <command> [args]\n"
         "  add [--h264] <file>...        chunk files and commit a manifest\n"
         "  ls <manifest>                 list manifest entries\n"
         "  show <asset>                  list the chunks of an asset\n"
         "  cat <asset> [offset length]   write asset bytes to stdout\n"
         "  export <asset> <destination>  write asset bytes to a file\n"
         "  diff <old-asset> <new-asset>  chunk level diff\n"
         "  drop <manifest>               release a committed manifest\n"
         "  gc [--dry-run]                delete unreferenced chunks\n"
         "  fsck                          re-hash every stored chunk\n"
         "  tier                          apply the lifecycle policy\n"
         "  checkpoint                    snapshot the chunk index\n"
         "  stats                         store statistics and metrics\n";
}

static ContentHash parseId(const std::string &text) {
  if (text.size() == 64)
    return ContentHash::fromHex(text);
  return ContentHash::fromCid(text);
}

static int add_command(StorageEngine &engine,
                       const std::vector<std::string> &args) {
  HintProvider hints;
  std::vector<std::string> files;
  for (const auto &a : args) {
    if (a == "--h264")
      hints = h264KeyframeHints();
    else
      files.push_back(a);
  }
  if (files.empty()) {
    usage();
    return 1;
  }

  const auto algo = engine.config().store.hash_algorithm;
  std::vector<Asset> assets = engine.addFiles(files, hints);
  Manifest manifest;
  for (const auto &asset : assets)
    manifest.set(asset.path, asset.id);
  ContentHash id;
  try {
    id = engine.commitManifest(manifest);
  } catch (const DitsError &) {
    for (const auto &asset : assets)
      engine.releaseAsset(asset);
    throw;
  }
  // The manifest now holds the references taken while adding.
  for (const auto &asset : assets)
    engine.releaseAsset(asset);

  for (const auto &asset : assets)
    std::cout << asset.id.toCid(algo) << '\t' << asset.size << '\t'
              << asset.chunks.size() << '\t' << asset.path << std::endl;
  std::cout << "manifest " << id.toCid(algo) << std::endl;
  return 0;
}

static int ls_command(StorageEngine &engine, const std::string &id) {
  const auto algo = engine.config().store.hash_algorithm;
  const Manifest manifest = engine.loadManifest(parseId(id));
  for (const auto &entry : manifest.entries())
    std::cout << entry.second.toCid(algo) << '\t' << entry.first << std::endl;
  return 0;
}

static int show_command(StorageEngine &engine, const std::string &id) {
  const Asset asset = engine.loadAsset(parseId(id));
  std::cout << "id " << asset.id.toHex() << "\nsize " << asset.size
            << "\nchunks " << asset.chunks.size() << std::endl;
  for (const auto &c : asset.chunks)
    std::cout << c.offset << '\t' << c.length << '\t' << c.hash.toHex()
              << (c.is_boundary_hint ? "\thint" : "") << std::endl;
  return 0;
}

static int cat_command(StorageEngine &engine,
                       const std::vector<std::string> &args) {
  const Asset asset = engine.loadAsset(parseId(args[0]));
  ByteSink sink = [](std::span<const std::byte> bytes) {
    std::cout.write(reinterpret_cast<const char *>(bytes.data()),
                    static_cast<std::streamsize>(bytes.size()));
    if (!std::cout)
      throwIoError("stdout write failed");
  };
  if (args.size() >= 3)
    engine.materializeRange(asset, std::stoull(args[1]), std::stoull(args[2]),
                            sink);
  else
    engine.materialize(asset, sink);
  std::cout.flush();
  return 0;
}

static int gc_command(StorageEngine &engine, bool dryRun) {
  const auto stats = engine.gc(dryRun);
  std::cout << "chunks " << stats.totalChunks << "\nreclaimable "
            << stats.reclaimableChunks << " (" << stats.reclaimableBytes
            << " bytes)\nremoved " << stats.chunksRemoved << " ("
            << stats.bytesReclaimed << " bytes)\nfailures " << stats.failures
            << std::endl;
  return stats.failures == 0 ? 0 : 2;
}

static int fsck_command(StorageEngine &engine) {
  const auto report = engine.verifyStore();
  for (const auto &h : report.corrupt)
    std::cout << "corrupt " << h.toHex() << std::endl;
  for (const auto &h : report.missing)
    std::cout << "missing " << h.toHex() << std::endl;
  for (const auto &key : report.orphaned)
    std::cout << "orphaned " << key << std::endl;
  std::cout << "checked " << report.checked << " chunks: "
            << (report.ok() ? "OK" : "ERRORS") << std::endl;
  return report.ok() ? 0 : 2;
}

static int stats_command(StorageEngine &engine) {
  const auto s = engine.chunkStore().stats();
  std::cout << "chunks " << s.chunks << "\nunreferenced " << s.unreferenced
            << "\nlogical_bytes " << s.logicalBytes << "\nstored_bytes "
            << s.storedBytes << "\nreferences " << s.totalReferences
            << std::endl;
  for (const auto &kv : s.chunksPerTier)
    std::cout << "tier_" << kv.first << ' ' << kv.second << std::endl;
  std::cout << MetricsRegistry::instance().toPrometheus();
  return 0;
}

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::string configPath;
  if (args.size() >= 2 && args[0] == "--config") {
    configPath = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    usage();
    return 1;
  }

  EngineConfig config;
  try {
    config = loadEngineConfig(configPath);
    if (!config.var_dir.empty())
      setVarDir(config.var_dir);
    std::filesystem::create_directories(logsDir());
    Logger::init(logsDir() + "/dits.log", config.log_level);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }

  const std::string cmd = args[0];
  const std::vector<std::string> rest(args.begin() + 1, args.end());
  try {
    StorageEngine engine(config);
    if (cmd == "add")
      return add_command(engine, rest);
    if (cmd == "ls" && rest.size() == 1)
      return ls_command(engine, rest[0]);
    if (cmd == "show" && rest.size() == 1)
      return show_command(engine, rest[0]);
    if (cmd == "cat" && (rest.size() == 1 || rest.size() == 3))
      return cat_command(engine, rest);
    if (cmd == "export" && rest.size() == 2) {
      engine.exportAsset(engine.loadAsset(parseId(rest[0])), rest[1]);
      return 0;
    }
    if (cmd == "diff" && rest.size() == 2) {
      const DiffResult result = engine.diffAssets(
          engine.loadAsset(parseId(rest[0])),
          engine.loadAsset(parseId(rest[1])));
      std::cout << DiffEngine::format(result);
      return 0;
    }
    if (cmd == "drop" && rest.size() == 1) {
      engine.dropManifest(parseId(rest[0]));
      return 0;
    }
    if (cmd == "gc")
      return gc_command(engine, !rest.empty() && rest[0] == "--dry-run");
    if (cmd == "fsck")
      return fsck_command(engine);
    if (cmd == "tier") {
      const auto moved = engine.applyLifecyclePolicy();
      for (const auto &t : moved)
        std::cout << t.hash.toHex() << '\t' << storageTierName(t.from)
                  << " -> " << storageTierName(t.to) << std::endl;
      return 0;
    }
    if (cmd == "checkpoint") {
      engine.checkpoint();
      return 0;
    }
    if (cmd == "stats")
      return stats_command(engine);
  } catch (const DitsError &e) {
    std::cerr << errorCodeName(e.code()) << ": " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << std::endl;
    return 2;
  }
  usage();
  return 1;
}
