#include "core/app_config.h"
#include "core/errors.h"
#include "core/logger.h"
#include "core/pipeline_config.h"
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string AppConfig::catalog_host_ = "localhost";
std::string AppConfig::catalog_db_ = "sharesync";
std::string AppConfig::catalog_user_ = "postgres";
std::string AppConfig::catalog_password_ = "";
std::string AppConfig::catalog_port_ = "5432";
StorageSettings AppConfig::storage_;
std::string AppConfig::log_level_ = "INFO";
bool AppConfig::console_logging_ = true;
bool AppConfig::initialized_ = false;
std::mutex AppConfig::configMutex_;

namespace {
bool validateAndSetPort(const std::string &portStr, std::string &targetPort) {
  if (portStr.empty() || portStr.length() > 5)
    return false;

  for (char c : portStr) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }

  int portNum = std::stoi(portStr);
  if (portNum > 0 && portNum <= 65535) {
    targetPort = portStr;
    return true;
  }
  return false;
}

// Ports may be written as numbers or strings in config.json.
std::string portValue(const json &value) {
  if (value.is_number_integer())
    return std::to_string(value.get<int>());
  return value.get<std::string>();
}

void readString(const json &section, const char *key, std::string &target) {
  if (section.contains(key) && section[key].is_string()) {
    std::string value = section[key].get<std::string>();
    if (!value.empty())
      target = value;
  }
}

const char *nonEmptyEnv(const char *name) {
  const char *value = std::getenv(name);
  if (value && strlen(value) > 0)
    return value;
  return nullptr;
}
} // namespace

std::string AppConfig::escapeConnectionParam(const std::string &param) {
  bool needsQuoting = param.empty();
  for (char c : param) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' ||
        c == '\\') {
      needsQuoting = true;
      break;
    }
  }
  if (!needsQuoting)
    return param;

  std::string escaped = "'";
  for (char c : param) {
    if (c == '\'' || c == '\\')
      escaped += '\\';
    escaped += c;
  }
  escaped += "'";
  return escaped;
}

void AppConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "AppConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults or environment variables");
    loadFromEnv();
    return;
  }

  json config;
  try {
    configFile >> config;
  } catch (const json::parse_error &e) {
    throw ConfigurationError("Invalid JSON in " + configPath + ": " +
                             std::string(e.what()));
  }

  try {
    std::lock_guard<std::mutex> lock(configMutex_);

    if (config.contains("catalog")) {
      const auto &catalog = config["catalog"];
      readString(catalog, "host", catalog_host_);
      readString(catalog, "database", catalog_db_);
      readString(catalog, "user", catalog_user_);
      if (catalog.contains("password"))
        catalog_password_ = catalog["password"].get<std::string>();
      if (catalog.contains("port")) {
        std::string port = portValue(catalog["port"]);
        if (!validateAndSetPort(port, catalog_port_)) {
          throw ConfigurationError("Invalid catalog port: " + port);
        }
      }
    }

    if (config.contains("storage")) {
      const auto &storage = config["storage"];
      readString(storage, "bucket", storage_.bucket);
      readString(storage, "region", storage_.region);
      readString(storage, "endpoint", storage_.endpoint);
      readString(storage, "access_key_id", storage_.accessKeyId);
      readString(storage, "secret_access_key", storage_.secretAccessKey);
      readString(storage, "staging_prefix", storage_.stagingPrefix);
      if (storage.contains("presign_expiry_seconds"))
        PipelineConfig::setPresignExpirySeconds(
            storage["presign_expiry_seconds"].get<size_t>());
      if (storage.contains("multipart_part_size_mb"))
        PipelineConfig::setMultipartPartSizeMb(
            storage["multipart_part_size_mb"].get<size_t>());
    }

    if (config.contains("pipeline")) {
      const auto &pipeline = config["pipeline"];
      if (pipeline.contains("fetch_batch_size"))
        PipelineConfig::setFetchBatchSize(
            pipeline["fetch_batch_size"].get<size_t>());
      if (pipeline.contains("compression_level"))
        PipelineConfig::setCompressionLevel(
            pipeline["compression_level"].get<int>());
    }

    if (config.contains("runner") && config["runner"].contains("max_workers")) {
      PipelineConfig::setMaxWorkers(
          config["runner"]["max_workers"].get<size_t>());
    }

    if (config.contains("logging")) {
      const auto &logging = config["logging"];
      readString(logging, "level", log_level_);
      if (logging.contains("console"))
        console_logging_ = logging["console"].get<bool>();
    }

    loadFromEnvUnlocked();
    initialized_ = true;
  } catch (const json::exception &e) {
    throw ConfigurationError("Invalid value in " + configPath + ": " +
                             std::string(e.what()));
  } catch (const std::invalid_argument &e) {
    throw ConfigurationError("Invalid value in " + configPath + ": " +
                             std::string(e.what()));
  }
}

void AppConfig::loadFromEnv() {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromEnvUnlocked();
  initialized_ = true;
}

void AppConfig::loadFromEnvUnlocked() {
  if (const char *host = nonEmptyEnv("SHARESYNC_CATALOG_HOST"))
    catalog_host_ = host;
  if (const char *port = nonEmptyEnv("SHARESYNC_CATALOG_PORT")) {
    if (!validateAndSetPort(port, catalog_port_)) {
      throw ConfigurationError("Invalid SHARESYNC_CATALOG_PORT: " +
                               std::string(port));
    }
  }
  if (const char *db = nonEmptyEnv("SHARESYNC_CATALOG_DB"))
    catalog_db_ = db;
  if (const char *user = nonEmptyEnv("SHARESYNC_CATALOG_USER"))
    catalog_user_ = user;
  if (const char *password = std::getenv("SHARESYNC_CATALOG_PASSWORD"))
    catalog_password_ = password;

  if (const char *bucket = nonEmptyEnv("SHARESYNC_STORAGE_BUCKET"))
    storage_.bucket = bucket;
  if (const char *keyId = nonEmptyEnv("AWS_ACCESS_KEY_ID"))
    storage_.accessKeyId = keyId;
  if (const char *secret = nonEmptyEnv("AWS_SECRET_ACCESS_KEY"))
    storage_.secretAccessKey = secret;
  if (const char *region = nonEmptyEnv("AWS_REGION"))
    storage_.region = region;

  if (const char *level = nonEmptyEnv("SHARESYNC_LOG_LEVEL"))
    log_level_ = level;

  if (catalog_password_.empty()) {
    Logger::warning(LogCategory::CONFIG, "AppConfig",
                    "Catalog password not set in config.json or "
                    "SHARESYNC_CATALOG_PASSWORD. Catalog connections may fail.");
  }
}
