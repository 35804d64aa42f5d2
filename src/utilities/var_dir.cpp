#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace dits {

static std::string varDir = [] {
  const char *env = std::getenv("DITS_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  return std::string(".dits");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string chunksDir() { return getVarDir() + "/objects/chunks"; }

std::string assetsDir() { return getVarDir() + "/objects/assets"; }

std::string blobsDir() { return getVarDir() + "/objects/blobs"; }

std::string manifestsDir() { return getVarDir() + "/objects/manifests"; }

std::string refLogPath() { return getVarDir() + "/refs.wal"; }

std::string indexSnapshotPath() { return getVarDir() + "/index.json"; }

std::string shardedPath(const std::string &root, const std::string &hex,
                        const std::string &suffix) {
  std::filesystem::path p(root);
  if (hex.size() <= 2)
    return (p / (hex + suffix)).string();
  return (p / hex.substr(0, 2) / (hex.substr(2) + suffix)).string();
}

} // namespace dits
