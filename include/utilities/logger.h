#pragma once
#ifndef DITS_LOGGER_H
#define DITS_LOGGER_H
#include <fstream>
#include <mutex>
#include <string>

namespace dits {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/// Parse "trace".."fatal" (case-insensitive). Throws ConfigError.
LogLevel parseLogLevel(const std::string &name);

/**
 * @brief Process-wide JSON-lines logger with size based rotation.
 *
 * Every record is one JSON object with "timestamp", "level" and "message"
 * keys. When the file grows beyond the configured size it is renamed to
 * "<file>.1", older backups shift up to maxBackupFiles.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel logLevel() const;
  void log(LogLevel level, const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  static void initLocked(const std::string &logFile, LogLevel level,
                         long long maxFileSizeVal, int maxBackupFilesVal);

  std::string getTimestamp() const;
  static std::string levelToString(LogLevel level);
  std::string formatRecord(LogLevel level, const std::string &message) const;
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace dits

#endif // DITS_LOGGER_H
