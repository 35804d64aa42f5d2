#ifndef DITS_REF_LOG_HPP
#define DITS_REF_LOG_HPP

#include <fstream>
#include <functional>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace dits {

/**
 * @brief Append-only journal of chunk index mutations.
 *
 * One JSON object per line. Records carry absolute values (reference
 * count, tier) so replaying a record twice is harmless. The log is
 * truncated after a successful index checkpoint.
 */
class RefLog {
public:
  /// Opens @p path for appending, creating parent directories.
  /// @throw IoError when the file cannot be opened.
  explicit RefLog(std::string path);

  /// Write and flush one record. @throw IoError on a short write.
  void append(const nlohmann::json &record);

  /// Discard every record written so far.
  void truncate();

  const std::string &path() const { return path_; }

  /**
   * @brief Feed every record of the log at @p path to @p apply.
   *
   * A malformed final line is a torn write and is skipped with a warning.
   * A malformed line anywhere else raises IntegrityError. A missing file
   * is an empty log.
   * @return Number of records applied.
   */
  static size_t replay(const std::string &path,
                       const std::function<void(const nlohmann::json &)> &apply);

private:
  std::mutex mutex_;
  std::string path_;
  std::ofstream out_;
};

/// Atomically replace @p path with @p doc (temporary file then rename).
void writeJsonFile(const std::string &path, const nlohmann::json &doc);

/// Parse the JSON document at @p path. @throw NotFoundError, IntegrityError
nlohmann::json readJsonFile(const std::string &path);

} // namespace dits

#endif // DITS_REF_LOG_HPP
