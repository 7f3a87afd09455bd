#include "spvmerkle/logger.h"
#include "spvmerkle/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio> // For std::rename and std::remove
#include <iomanip>
#include <sstream>
#include <string>

namespace spvmerkle {

namespace {
std::string escapeJsonString(const std::string &input) {
  std::ostringstream ss;
  for (char c : input) {
    switch (c) {
    case '\\':
      ss << "\\\\";
      break;
    case '"':
      ss << "\\\"";
      break;
    case '\b':
      ss << "\\b";
      break;
    case '\f':
      ss << "\\f";
      break;
    case '\n':
      ss << "\\n";
      break;
    case '\r':
      ss << "\\r";
      break;
    case '\t':
      ss << "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
           << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
      } else {
        ss << c;
      }
      break;
    }
  }
  return ss.str();
}
} // namespace

Logger *Logger::s_instance = nullptr;
std::recursive_mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
  s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
}

Logger &Logger::getInstance() {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_instance) {
    std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
                 "Logger::init(). Falling back to console output."
              << std::endl;
    Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream.open(logFilePath, std::ios::app);
    if (!logFileStream.is_open()) {
      std::cerr << "Error: Could not open log file: " << logFilePath
                << std::endl;
    }
  }
}

Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

LogLevel Logger::parseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  for (LogLevel level : {TRACE, DEBUG, INFO, WARN, ERROR, FATAL}) {
    if (levelToString(level) == upper)
      return level;
  }
  throw ConfigError("Unknown log level: " + name);
}

std::string Logger::formatRecord(LogLevel level, const std::string &message) {
  return "{\"timestamp\": \"" + getTimestamp() + "\", \"level\": \"" +
         levelToString(level) + "\", \"message\": \"" +
         escapeJsonString(message) + "\"}";
}

void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0)
    return;
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize)
    return;

  logFileStream.close();
  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string tooOldPath = logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(tooOldPath.c_str());

    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string oldPath = logFilePath + "." + std::to_string(i);
      std::string newPath = logFilePath + "." + std::to_string(i + 1);
      std::ifstream oldFileTest(oldPath.c_str());
      if (oldFileTest.good()) {
        oldFileTest.close();
        std::remove(newPath.c_str());
        std::rename(oldPath.c_str(), newPath.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }
  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }
  const std::string line = formatRecord(level, message);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << line << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << line << std::endl;
  }
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm *localTime = std::localtime(&currentTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", localTime);
  return std::string(timestamp);
}

} // namespace spvmerkle
