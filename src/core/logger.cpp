#include "core/logger.h"
#include "core/app_config.h"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

std::unique_ptr<DatabaseLogWriter> Logger::dbWriter_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
bool Logger::consoleOutput = false;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

namespace {
std::string currentTimestamp() {
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
} // namespace

std::string Logger::formatLogMessage(const std::string &timestamp,
                                     const std::string &levelStr,
                                     const std::string &categoryStr,
                                     const std::string &function,
                                     const std::string &message) {
  std::ostringstream oss;
  oss << "[" << timestamp << "] [" << levelStr << "] [" << categoryStr << "]";
  if (!function.empty()) {
    oss << " [" << function << "]";
  }
  oss << " " << message;
  return oss.str();
}

std::string Logger::getLevelString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::getCategoryString(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::DATABASE:
    return "DATABASE";
  case LogCategory::TRANSFER:
    return "TRANSFER";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::VALIDATION:
    return "VALIDATION";
  case LogCategory::WAREHOUSE:
    return "WAREHOUSE";
  case LogCategory::STORAGE:
    return "STORAGE";
  case LogCategory::WEBHOOK:
    return "WEBHOOK";
  case LogCategory::CATALOG:
    return "CATALOG";
  default:
    return "UNKNOWN";
  }
}

LogLevel Logger::stringToLogLevel(const std::string &levelStr) {
  std::string upper = levelStr;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
  auto it = levelMap.find(upper);
  return (it != levelMap.end()) ? it->second : LogLevel::INFO;
}

// Writes one entry to every enabled sink. Entries below the configured level
// are dropped before any formatting happens. The database sink receives the
// parsed fields; the console sink receives the formatted line on stderr.
void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  LogLevel minLevel;
  bool toConsole;
  {
    std::lock_guard<std::mutex> configLock(configMutex);
    minLevel = currentLogLevel;
    toConsole = consoleOutput;
  }

  if (level < minLevel) {
    return;
  }

  std::string levelStr = getLevelString(level);
  std::string categoryStr = getCategoryString(category);

  DatabaseLogWriter *writer = nullptr;
  {
    std::lock_guard<std::mutex> lock(logMutex);
    if (dbWriter_ && dbWriter_->isEnabled()) {
      writer = dbWriter_.get();
    }
    if (toConsole) {
      std::cerr << formatLogMessage(currentTimestamp(), levelStr, categoryStr,
                                    function, message)
                << std::endl;
    }
  }

  if (writer) {
    writer->write(LogRecord{levelStr, categoryStr, function, message});
  }
}

// Reads the debug_level override from sharesync.config. The catalog value
// wins over the one from config.json so operators can raise verbosity on a
// running fleet. Connection or query failures leave the current level as is.
void Logger::loadDebugConfig() {
  std::string connStr = AppConfig::getCatalogConnectionString();
  if (connStr.empty()) {
    return;
  }

  try {
    pqxx::connection conn(connStr);
    pqxx::work txn(conn);
    auto result = txn.exec(
        "SELECT value FROM sharesync.config WHERE key = 'debug_level'");
    txn.commit();

    if (!result.empty() && !result[0][0].is_null()) {
      std::string levelStr = result[0][0].as<std::string>();
      if (!levelStr.empty()) {
        setLogLevel(levelStr);
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Logger: could not read debug_level from catalog: "
              << e.what() << std::endl;
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Accepts DEBUG, INFO, WARN/WARNING, ERROR, FATAL/CRITICAL in any case.
// Unknown values are ignored.
void Logger::setLogLevel(const std::string &levelStr) {
  if (levelStr.empty()) {
    return;
  }

  std::string upperLevelStr = levelStr;
  std::transform(upperLevelStr.begin(), upperLevelStr.end(),
                 upperLevelStr.begin(), ::toupper);
  if (levelMap.find(upperLevelStr) == levelMap.end()) {
    return;
  }

  setLogLevel(stringToLogLevel(upperLevelStr));
}

void Logger::setConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(configMutex);
  consoleOutput = enabled;
}

// Initializes the Logger from AppConfig, then opens the database log writer
// against the catalog. If the catalog is unreachable logging keeps working
// on the console only. Must be called after AppConfig has been loaded.
void Logger::initialize() {
  setLogLevel(AppConfig::getLogLevel());
  setConsoleOutput(AppConfig::getConsoleLogging());

  loadDebugConfig();

  std::lock_guard<std::mutex> lock(logMutex);
  try {
    std::string connStr = AppConfig::getCatalogConnectionString();
    if (!connStr.empty()) {
      dbWriter_ = std::make_unique<DatabaseLogWriter>(connStr);
      if (!dbWriter_->isEnabled()) {
        std::cerr << "Warning: Database log writer initialization failed. "
                     "Logging to database will be disabled."
                  << std::endl;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Error initializing database log writer: " << e.what()
              << std::endl;
  }
}
