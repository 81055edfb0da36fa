#include "catalog/postgres_catalog_store.h"
#include "core/app_config.h"
#include "core/errors.h"
#include "core/logger.h"
#include "core/pipeline_config.h"
#include "engines/connection_provider.h"
#include "governance/HttpClient.h"
#include "governance/WebhookNotifier.h"
#include "loaders/loader_factory.h"
#include "storage/S3ObjectStorage.h"
#include "sync/TransferOrchestrator.h"
#include "sync/TransferRunner.h"
#include <curl/curl.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_INIT_ERROR = 2;
constexpr int EXIT_EXECUTION_ERROR = 3;
constexpr int EXIT_CRITICAL_ERROR = 4;
constexpr int EXIT_CONFIG_ERROR = 6;

struct CommandLine {
  std::string configPath = "config.json";
  std::vector<int64_t> transferIds;
};

void printUsage() {
  std::cerr << "Usage: sharesync [--config <path>] <transfer-id>..."
            << std::endl;
}

// Throws std::invalid_argument on malformed arguments.
CommandLine parseCommandLine(int argc, char *argv[]) {
  CommandLine cmd;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc)
        throw std::invalid_argument("--config requires a path");
      cmd.configPath = argv[++i];
      continue;
    }
    size_t consumed = 0;
    long long id = std::stoll(arg, &consumed);
    if (consumed != arg.size() || id <= 0)
      throw std::invalid_argument("Invalid transfer id: " + arg);
    cmd.transferIds.push_back(static_cast<int64_t>(id));
  }
  if (cmd.transferIds.empty())
    throw std::invalid_argument("No transfer ids given");
  return cmd;
}

void cleanupLogger() {
  try {
    Logger::shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Logger shutdown failed: " << e.what() << std::endl;
  }
}

class CurlGlobalSession {
public:
  CurlGlobalSession() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
      throw std::runtime_error("curl_global_init failed");
  }
  ~CurlGlobalSession() { curl_global_cleanup(); }

  CurlGlobalSession(const CurlGlobalSession &) = delete;
  CurlGlobalSession &operator=(const CurlGlobalSession &) = delete;
};
} // namespace

int main(int argc, char *argv[]) {
  CommandLine cmd;
  try {
    cmd = parseCommandLine(argc, argv);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    printUsage();
    return EXIT_CONFIG_ERROR;
  }

  try {
    AppConfig::loadFromFile(cmd.configPath);
  } catch (const ConfigurationError &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  if (!AppConfig::isInitialized()) {
    std::cerr << "Error: Configuration failed to initialize. "
                 "Please check " << cmd.configPath
              << " or environment variables." << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  try {
    Logger::initialize();
    Logger::info(LogCategory::SYSTEM, "main",
                 "ShareSync started (catalog: " +
                     AppConfig::getCatalogConnectionStringForLogging() + ")");

    CurlGlobalSession curlSession;
    AwsSdkSession awsSession;

    std::vector<TransferOutcome> outcomes;
    try {
      StorageSettings storage = AppConfig::getStorageSettings();
      auto exportStorage = std::make_shared<S3ObjectStorage>(storage);
      auto stagingStorage =
          std::make_shared<S3ObjectStorage>(storage, storage.stagingPrefix);

      PostgresCatalogStore catalog(AppConfig::getCatalogConnectionString());
      DefaultConnectionProvider connections;
      DefaultLoaderFactory loaders(connections, exportStorage, stagingStorage);
      TransferOrchestrator orchestrator(catalog, connections, loaders);

      CurlHttpClient http;
      WebhookNotifier notifier(catalog, http);

      TransferRunner runner(orchestrator, &notifier,
                            PipelineConfig::getMaxWorkers());
      outcomes = runner.run(cmd.transferIds);
    } catch (const ConfigurationError &e) {
      Logger::error(LogCategory::CONFIG, "main",
                    "Configuration error: " + std::string(e.what()));
      std::cerr << "Configuration error: " << e.what() << std::endl;
      cleanupLogger();
      return EXIT_CONFIG_ERROR;
    }

    bool allFinished = true;
    for (const auto &outcome : outcomes) {
      std::cout << outcome.transferId << " "
                << transferDispositionToString(outcome.disposition);
      if (outcome.objectUrl)
        std::cout << " " << *outcome.objectUrl;
      std::cout << std::endl;
      if (outcome.disposition == TransferDisposition::FAILED ||
          outcome.disposition == TransferDisposition::REJECTED)
        allFinished = false;
    }

    Logger::info(LogCategory::SYSTEM, "main", "ShareSync finished");
    cleanupLogger();
    return allFinished ? EXIT_SUCCESS_CODE : EXIT_EXECUTION_ERROR;

  } catch (const std::runtime_error &e) {
    std::cerr << "Initialization error: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_INIT_ERROR;
  } catch (const std::exception &e) {
    std::cerr << "Critical error in main: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_CRITICAL_ERROR;
  }
}
