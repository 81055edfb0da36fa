#ifndef LOGGER_H
#define LOGGER_H

#include "core/database_log_writer.h"
#include <memory>
#include <mutex>
#include <string>
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
  VALIDATION = 4,
  WAREHOUSE = 5,
  STORAGE = 6,
  WEBHOOK = 7,
  CATALOG = 8
};

class Logger {
private:
  static std::unique_ptr<DatabaseLogWriter> dbWriter_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static bool consoleOutput;
  static std::mutex configMutex;

  static const std::unordered_map<std::string, LogLevel> levelMap;

  static std::string formatLogMessage(const std::string &timestamp,
                                      const std::string &levelStr,
                                      const std::string &categoryStr,
                                      const std::string &function,
                                      const std::string &message);
  static std::string getLevelString(LogLevel level);
  static std::string getCategoryString(LogCategory category);
  static LogLevel stringToLogLevel(const std::string &levelStr);

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function,
                       const std::string &message);

public:
  static void initialize();

  static void shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (dbWriter_) {
      dbWriter_->close();
    }
    dbWriter_.reset();
  }

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

  // Configuration management
  static void loadDebugConfig();
  static void setLogLevel(LogLevel level);
  static void setLogLevel(const std::string &levelStr);
  static void setConsoleOutput(bool enabled);
};

#endif
