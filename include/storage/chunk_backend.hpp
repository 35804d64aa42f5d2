#ifndef DITS_CHUNK_BACKEND_HPP
#define DITS_CHUNK_BACKEND_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dits {

/**
 * @brief Physical placement of stored chunk objects.
 *
 * Keys are lowercase hex digests. Implementations must make write() atomic:
 * after a failed write the key is either absent or holds its previous
 * content. Failures are reported as IoError, absent keys as NotFoundError.
 */
class ChunkBackend {
public:
  virtual ~ChunkBackend() = default;

  virtual void write(const std::string &key,
                     const std::vector<std::byte> &data) = 0;
  virtual std::vector<std::byte> read(const std::string &key) const = 0;
  virtual bool exists(const std::string &key) const = 0;
  virtual void remove(const std::string &key) = 0;
  virtual std::vector<std::string> list() const = 0;
};

/// Process-local backend, used by tests and the "memory" backend option.
class MemoryChunkBackend : public ChunkBackend {
public:
  void write(const std::string &key,
             const std::vector<std::byte> &data) override;
  std::vector<std::byte> read(const std::string &key) const override;
  bool exists(const std::string &key) const override;
  void remove(const std::string &key) override;
  std::vector<std::string> list() const override;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<std::byte>> objects_;
};

/**
 * @brief Objects stored as files under "<root>/<hh>/<remaining hex>".
 *
 * The two character prefix bounds the fan-out of any single directory.
 * Writes go to a temporary sibling and are renamed into place. An optional
 * @p suffix is appended to every file name (".json" for records).
 */
class FilesystemChunkBackend : public ChunkBackend {
public:
  explicit FilesystemChunkBackend(std::string root, std::string suffix = {});

  void write(const std::string &key,
             const std::vector<std::byte> &data) override;
  std::vector<std::byte> read(const std::string &key) const override;
  bool exists(const std::string &key) const override;
  void remove(const std::string &key) override;
  std::vector<std::string> list() const override;

  const std::string &root() const { return root_; }
  std::string objectPath(const std::string &key) const;

private:
  std::string root_;
  std::string suffix_;
};

} // namespace dits

#endif // DITS_CHUNK_BACKEND_HPP
