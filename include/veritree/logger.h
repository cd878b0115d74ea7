#pragma once
#ifndef VERITREE_LOGGER_H
#define VERITREE_LOGGER_H
#include <fstream>
#include <mutex>
#include <string>

namespace veritree {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Parse a level name such as "debug" or "WARN".
 * @throws std::invalid_argument for unknown names.
 */
LogLevel logLevelFromString(const std::string &name);

/**
 * @brief Process-wide logger.
 *
 * Each line is plain text, `YYYY-MM-DD HH:MM:SS [LEVEL] message`. No JSON
 * structure is emitted, so consumers should not parse lines as JSON.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  /**
   * @brief (Re)initialize the process-wide logger.
   *
   * @param logFile        Target file, or CONSOLE_ONLY_OUTPUT for stdout.
   * @param level          Messages below this level are dropped.
   * @param maxFileSize    Rotate once the file reaches this many bytes
   *                       (0 disables rotation).
   * @param maxBackupFiles Number of numbered backups kept on rotation.
   */
  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void log(LogLevel level, const std::string &message);

  /**
   * @brief Convenience wrapper for TRACE level logging.
   *
   * Formats the provided printf-style string and logs it at TRACE level.
   *
   * @param format printf-style format string.
   * @param ...    Format arguments.
   */
  static void trace(const char *format, ...);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  static std::string levelToString(LogLevel level);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

} // namespace veritree

#endif // VERITREE_LOGGER_H
