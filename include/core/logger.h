#ifndef LOGGER_H
#define LOGGER_H

#include "core/database_log_writer.h"
#include "core/file_log_writer.h"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  DATABASE = 1,
  TRANSFER = 2,
  CONFIG = 3,
  STATE = 4,
  VALIDATION = 5,
  PROJECT = 6,
  UNKNOWN = 99
};

struct LoggerSettings {
  LogLevel level = LogLevel::INFO;
  std::string filePath;
  size_t maxFileSize = 10 * 1024 * 1024;
  int maxBackupFiles = 5;
  bool console = false;
  bool showThreadId = false;
  std::string postgresConnection;
};

class Logger {
private:
  static std::unique_ptr<FileLogWriter> fileWriter_;
  static std::unique_ptr<DatabaseLogWriter> dbWriter_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static bool consoleEnabled;
  static bool showThreadId;
  static std::mutex configMutex;

  static const std::unordered_map<std::string, LogLevel> levelMap;

  static std::string formatLogMessage(const std::string &timestamp,
                                      const std::string &levelStr,
                                      const std::string &categoryStr,
                                      const std::string &function,
                                      const std::string &message,
                                      bool withThreadId) {
    std::ostringstream oss;
    oss << "[" << timestamp << "] [" << levelStr << "] [" << categoryStr << "]";
    if (withThreadId) {
      oss << " [tid " << std::this_thread::get_id() << "]";
    }
    if (!function.empty()) {
      oss << " [" << function << "]";
    }
    oss << " " << message;
    return oss.str();
  }

  static std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::stringstream ss;
    localtime_r(&time_t, &tm_buf);
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
  }

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function,
                       const std::string &message);

  static LogLevel stringToLogLevel(const std::string &levelStr) {
    auto it = levelMap.find(levelStr);
    return (it != levelMap.end()) ? it->second : LogLevel::INFO;
  }

public:
  static std::string getLevelString(LogLevel level);
  static std::string getCategoryString(LogCategory category);

  // Opens the sinks described by AppConfig (file, optional PostgreSQL table).
  static void initialize();
  static void initialize(const LoggerSettings &settings);
  static void shutdown();

  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::DEBUG, category, function, message);
  }

  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    writeLog(LogLevel::INFO, category, function, message);
  }

  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    writeLog(LogLevel::WARNING, category, function, message);
  }

  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::ERROR, category, function, message);
  }

  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, function, message);
  }
};

#endif
