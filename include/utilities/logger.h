#pragma once
#ifndef SHAREDIDX_LOGGER_H
#define SHAREDIDX_LOGGER_H
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide structured logger.
 *
 * Every record is written as one JSON object per line with the fields
 * `timestamp`, `level`, `component` and `message`. File output is rotated
 * once it grows beyond the configured size.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  /// Pass as the log file to write records to stdout only.
  static const std::string CONSOLE_ONLY_OUTPUT;

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  void log(LogLevel level, const std::string &message);

  /**
   * @brief Log a record tagged with the emitting component.
   * @param level     Severity of the record.
   * @param component Short subsystem name, e.g. "loader".
   * @param message   Free-form text.
   */
  void log(LogLevel level, const std::string &component,
           const std::string &message);

  static std::string levelToString(LogLevel level);
  static LogLevel levelFromString(const std::string &name,
                                  LogLevel fallback = LogLevel::INFO);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  void rotateIfNeeded();
  std::string getTimestamp() const;

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

#endif
