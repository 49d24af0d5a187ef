#include "utilities/logger.h"
#include <cstdio> // For std::rename and std::remove
#include <ctime>
#include <new>
#include <sstream>

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
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
        ss << buf;
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
std::mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &e) {
    std::cerr << "[Logger::init] CRITICAL: allocation failed: " << e.what()
              << std::endl;
  }
}

Logger &Logger::getInstance() {
  {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_instance) {
      return *s_instance;
    }
  }
  // Nobody called init(): fall back to console output so library code can
  // always log.
  init(CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
  std::lock_guard<std::mutex> lock(s_mutex);
  if (!s_instance) {
    throw std::runtime_error("Logger not initialized and emergency init failed");
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

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_mutex);
  currentLogLevel = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(s_mutex);
  return currentLogLevel;
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

LogLevel Logger::levelFromString(const std::string &name, LogLevel fallback) {
  if (name == "TRACE" || name == "trace")
    return TRACE;
  if (name == "DEBUG" || name == "debug")
    return DEBUG;
  if (name == "INFO" || name == "info")
    return INFO;
  if (name == "WARN" || name == "warn")
    return WARN;
  if (name == "ERROR" || name == "error")
    return ERROR;
  if (name == "FATAL" || name == "fatal")
    return FATAL;
  return fallback;
}

void Logger::log(LogLevel level, const std::string &message) {
  log(level, "", message);
}

void Logger::log(LogLevel level, const std::string &component,
                 const std::string &message) {
  std::lock_guard<std::mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }

  std::ostringstream line;
  line << "{\"timestamp\":\"" << getTimestamp() << "\",\"level\":\""
       << levelToString(level) << "\"";
  if (!component.empty()) {
    line << ",\"component\":\"" << escapeJsonString(component) << "\"";
  }
  line << ",\"message\":\"" << escapeJsonString(message) << "\"}";

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << line.str() << std::endl;
    return;
  }

  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << line.str() << std::endl;
  }
}

// Caller holds s_mutex.
void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0) {
    return;
  }
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize) {
    return;
  }
  logFileStream.close();

  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string oldest = logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(oldest.c_str());
    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string from = logFilePath + "." + std::to_string(i);
      std::string to = logFilePath + "." + std::to_string(i + 1);
      std::ifstream probe(from.c_str());
      if (probe.good()) {
        probe.close();
        std::rename(from.c_str(), to.c_str());
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

std::string Logger::getTimestamp() const {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}
