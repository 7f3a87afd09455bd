#pragma once
#ifndef SPVMERKLE_LOGGER_H
#define SPVMERKLE_LOGGER_H
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace spvmerkle {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide JSON-lines logger with size based rotation.
 *
 * Every record is written as one object with `timestamp`, `level` and
 * `message` keys. When the file reaches @c maxFileSize bytes it is renamed to
 * `<file>.1`, older backups shift up by one, and anything beyond
 * @c maxBackupFiles is removed.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Write to stdout, no file

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);

  /**
   * @brief Access the logger.
   *
   * Falls back to a console-only WARN logger when init() has not been called.
   */
  static Logger &getInstance();

  void log(LogLevel level, const std::string &message);

  /// Parse "trace", "debug", "info", "warn", "error" or "fatal".
  static LogLevel parseLevel(const std::string &name);
  static std::string levelToString(LogLevel level);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  std::string formatRecord(LogLevel level, const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::recursive_mutex s_mutex;
};

} // namespace spvmerkle

#endif // SPVMERKLE_LOGGER_H
