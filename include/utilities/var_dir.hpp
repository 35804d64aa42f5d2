#pragma once

#include <string>

namespace dits {

/**
 * Root of the on-disk repository state. Resolved from DITS_VAR_DIR, then
 * ".dits" in the working directory.
 */
void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string chunksDir();
std::string assetsDir();
std::string blobsDir();
std::string manifestsDir();
std::string refLogPath();
std::string indexSnapshotPath();

/// "ab/cdef..." placement for a 64-char hex key under @p root.
std::string shardedPath(const std::string &root, const std::string &hex,
                        const std::string &suffix = "");

} // namespace dits
