#ifndef DITS_ERRORS_HPP
#define DITS_ERRORS_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace dits {

/// Error taxonomy shared by every engine component.
enum class ErrorCode {
  Io,        ///< Stream or backend read/write failure, retryable.
  Integrity, ///< Stored data does not match its content hash.
  NotFound,  ///< Referenced chunk or record is missing.
  Config,    ///< Invalid configuration value.
  Cancelled  ///< Operation aborted by the caller.
};

const char *errorCodeName(ErrorCode code);

/**
 * @brief Base class for all engine exceptions.
 *
 * Carries an ErrorCode so callers can branch on the category without
 * relying on the dynamic type.
 */
class DitsError : public std::runtime_error {
public:
  DitsError(ErrorCode code, const std::string &message);

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

class IoError : public DitsError {
public:
  explicit IoError(const std::string &message, std::string path = {});

  /// File the failure relates to, empty when not file backed.
  const std::string &path() const noexcept { return path_; }

private:
  std::string path_;
};

/**
 * @brief Hash mismatch or structural corruption.
 *
 * When raised during reconstruction the offending chunk hash, its index in
 * the asset and its byte offset are attached.
 */
class IntegrityError : public DitsError {
public:
  explicit IntegrityError(const std::string &message,
                          std::string chunkHash = {},
                          std::optional<size_t> chunkIndex = std::nullopt,
                          std::optional<uint64_t> byteOffset = std::nullopt);

  const std::string &chunkHash() const noexcept { return chunkHash_; }
  std::optional<size_t> chunkIndex() const noexcept { return chunkIndex_; }
  std::optional<uint64_t> byteOffset() const noexcept { return byteOffset_; }

private:
  std::string chunkHash_;
  std::optional<size_t> chunkIndex_;
  std::optional<uint64_t> byteOffset_;
};

class NotFoundError : public DitsError {
public:
  explicit NotFoundError(const std::string &id);

  const std::string &id() const noexcept { return id_; }

private:
  std::string id_;
};

class ConfigError : public DitsError {
public:
  explicit ConfigError(const std::string &message);
};

class CancelledError : public DitsError {
public:
  explicit CancelledError(const std::string &what);
};

// Log the message at ERROR level and throw the matching exception.
[[noreturn]] void throwIoError(const std::string &message,
                               const std::string &path = {});
[[noreturn]] void throwIntegrityError(const std::string &message,
                                      const std::string &chunkHash = {},
                                      std::optional<size_t> index = std::nullopt,
                                      std::optional<uint64_t> offset =
                                          std::nullopt);
[[noreturn]] void throwNotFound(const std::string &id);
[[noreturn]] void throwConfigError(const std::string &message);

} // namespace dits

#endif // DITS_ERRORS_HPP
