#include "utilities/errors.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <iostream>
#include <utility>

namespace dits {

const char *errorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::Io:
    return "IoError";
  case ErrorCode::Integrity:
    return "IntegrityError";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::Config:
    return "ConfigError";
  case ErrorCode::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

DitsError::DitsError(ErrorCode code, const std::string &message)
    : std::runtime_error(message), code_(code) {}

IoError::IoError(const std::string &message, std::string path)
    : DitsError(ErrorCode::Io,
                path.empty() ? message : path + ": " + message),
      path_(std::move(path)) {}

static std::string integrityMessage(const std::string &message,
                                    const std::string &chunkHash,
                                    std::optional<size_t> index,
                                    std::optional<uint64_t> offset) {
  std::string details;
  auto append = [&details](const std::string &part) {
    details += details.empty() ? part : ", " + part;
  };
  if (!chunkHash.empty())
    append("chunk " + chunkHash);
  if (index)
    append("index " + std::to_string(*index));
  if (offset)
    append("offset " + std::to_string(*offset));
  return details.empty() ? message : message + " (" + details + ")";
}

IntegrityError::IntegrityError(const std::string &message,
                               std::string chunkHash,
                               std::optional<size_t> chunkIndex,
                               std::optional<uint64_t> byteOffset)
    : DitsError(ErrorCode::Integrity,
                integrityMessage(message, chunkHash, chunkIndex, byteOffset)),
      chunkHash_(std::move(chunkHash)), chunkIndex_(chunkIndex),
      byteOffset_(byteOffset) {}

NotFoundError::NotFoundError(const std::string &id)
    : DitsError(ErrorCode::NotFound, "Object not found: " + id), id_(id) {}

ConfigError::ConfigError(const std::string &message)
    : DitsError(ErrorCode::Config, "Invalid configuration: " + message) {}

CancelledError::CancelledError(const std::string &what)
    : DitsError(ErrorCode::Cancelled, what + " cancelled") {}

// Logging must never mask the original error, so a logger that is not
// initialized falls back to stderr.
static void logError(const std::string &msg) {
  try {
    Logger::getInstance().log(LogLevel::ERROR, msg);
  } catch (const std::runtime_error &e) {
    std::cerr << "Logger not initialized. Original error: " << msg
              << " Logger error: " << e.what() << std::endl;
  }
}

void throwIoError(const std::string &message, const std::string &path) {
  IoError err(message, path);
  logError(std::string("IoError: ") + err.what());
  throw err;
}

void throwIntegrityError(const std::string &message,
                         const std::string &chunkHash,
                         std::optional<size_t> index,
                         std::optional<uint64_t> offset) {
  IntegrityError err(message, chunkHash, index, offset);
  logError(std::string("IntegrityError: ") + err.what());
  MetricsRegistry::instance().incrementCounter("dits_integrity_errors_total");
  throw err;
}

void throwNotFound(const std::string &id) {
  logError("NotFound: " + id);
  throw NotFoundError(id);
}

void throwConfigError(const std::string &message) {
  logError("ConfigError: " + message);
  throw ConfigError(message);
}

} // namespace dits
