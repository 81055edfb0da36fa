#ifndef APP_CONFIG_H
#define APP_CONFIG_H

#include <mutex>
#include <string>

struct StorageSettings {
  std::string bucket;
  std::string region = "us-east-1";
  std::string endpoint;
  std::string accessKeyId;
  std::string secretAccessKey;
  std::string stagingPrefix = "staging/";
};

class AppConfig {
private:
  static std::string catalog_host_;
  static std::string catalog_db_;
  static std::string catalog_user_;
  static std::string catalog_password_;
  static std::string catalog_port_;
  static StorageSettings storage_;
  static std::string log_level_;
  static bool console_logging_;
  static bool initialized_;
  static std::mutex configMutex_;

  static std::string escapeConnectionParam(const std::string &param);
  static void loadFromEnvUnlocked();

public:
  // Reads config.json, then applies environment overrides. Numeric pipeline
  // settings are forwarded to PipelineConfig and throw std::invalid_argument
  // when out of range.
  static void loadFromFile(const std::string &configPath = "config.json");
  static void loadFromEnv();

  static std::string getCatalogConnectionString() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return "host=" + escapeConnectionParam(catalog_host_) +
           " dbname=" + escapeConnectionParam(catalog_db_) +
           " user=" + escapeConnectionParam(catalog_user_) +
           " password=" + escapeConnectionParam(catalog_password_) +
           " port=" + escapeConnectionParam(catalog_port_);
  }

  static std::string getCatalogConnectionStringForLogging() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return "host=" + escapeConnectionParam(catalog_host_) +
           " dbname=" + escapeConnectionParam(catalog_db_) +
           " user=" + escapeConnectionParam(catalog_user_) +
           " password=*** port=" + escapeConnectionParam(catalog_port_);
  }

  static StorageSettings getStorageSettings() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return storage_;
  }

  static void setStorageSettings(const StorageSettings &settings) {
    std::lock_guard<std::mutex> lock(configMutex_);
    storage_ = settings;
  }

  static std::string getLogLevel() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return log_level_;
  }

  static bool getConsoleLogging() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return console_logging_;
  }

  static bool isInitialized() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return initialized_;
  }
};

#endif
