#include "storage/chunk_backend.hpp"
#include "utilities/errors.hpp"
#include "utilities/var_dir.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace dits {

namespace fs = std::filesystem;

void MemoryChunkBackend::write(const std::string &key,
                               const std::vector<std::byte> &data) {
  std::lock_guard<std::mutex> lock(mutex_);
  objects_[key] = data;
}

std::vector<std::byte> MemoryChunkBackend::read(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(key);
  if (it == objects_.end())
    throw NotFoundError(key);
  return it->second;
}

bool MemoryChunkBackend::exists(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.count(key) > 0;
}

void MemoryChunkBackend::remove(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  objects_.erase(key);
}

std::vector<std::string> MemoryChunkBackend::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(objects_.size());
  for (const auto &kv : objects_)
    keys.push_back(kv.first);
  return keys;
}

FilesystemChunkBackend::FilesystemChunkBackend(std::string root,
                                               std::string suffix)
    : root_(std::move(root)), suffix_(std::move(suffix)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec)
    throwIoError("cannot create chunk directory: " + ec.message(), root_);
}

std::string FilesystemChunkBackend::objectPath(const std::string &key) const {
  return shardedPath(root_, key, suffix_);
}

void FilesystemChunkBackend::write(const std::string &key,
                                   const std::vector<std::byte> &data) {
  static std::atomic<unsigned long> tmpCounter{0};
  const fs::path target = objectPath(key);
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec)
    throwIoError("cannot create shard directory: " + ec.message(),
                 target.parent_path().string());

  const fs::path tmp =
      target.string() + ".tmp." + std::to_string(::getpid()) + "." +
      std::to_string(tmpCounter.fetch_add(1));
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
      throwIoError("cannot open for writing", tmp.string());
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      throwIoError("short write", tmp.string());
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throwIoError("rename failed: " + ec.message(), target.string());
  }
}

std::vector<std::byte>
FilesystemChunkBackend::read(const std::string &key) const {
  const std::string path = objectPath(key);
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in.is_open()) {
    std::error_code ec;
    if (!fs::exists(path, ec))
      throw NotFoundError(key);
    throwIoError("cannot open for reading", path);
  }
  const std::streamsize size = in.tellg();
  if (size < 0)
    throwIoError("cannot determine size", path);
  in.seekg(0, std::ios::beg);
  std::vector<std::byte> data(static_cast<size_t>(size));
  in.read(reinterpret_cast<char *>(data.data()), size);
  if (in.gcount() != size)
    throwIoError("short read", path);
  return data;
}

bool FilesystemChunkBackend::exists(const std::string &key) const {
  std::error_code ec;
  return fs::exists(objectPath(key), ec);
}

void FilesystemChunkBackend::remove(const std::string &key) {
  std::error_code ec;
  fs::remove(objectPath(key), ec);
  if (ec)
    throwIoError("remove failed: " + ec.message(), objectPath(key));
}

std::vector<std::string> FilesystemChunkBackend::list() const {
  std::vector<std::string> keys;
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(root_, ec);
       it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec)
      throwIoError("directory walk failed: " + ec.message(), root_);
    if (!it->is_regular_file())
      continue;
    std::string name = it->path().filename().string();
    if (name.find(".tmp.") != std::string::npos)
      continue;
    if (!suffix_.empty()) {
      if (name.size() <= suffix_.size() ||
          name.compare(name.size() - suffix_.size(), suffix_.size(),
                       suffix_) != 0)
        continue;
      name.resize(name.size() - suffix_.size());
    }
    keys.push_back(it->path().parent_path().filename().string() + name);
  }
  return keys;
}

} // namespace dits
