#ifndef CATALOG_MODELS_H
#define CATALOG_MODELS_H

#include "utils/time_utils.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class TransferStatus { STARTED, PENDING, COMPLETE, FAILED, CANCELLED };

enum class DbEngine { POSTGRES, MYSQL, REDSHIFT, SNOWFLAKE };

enum class DestinationType { PROVISIONED_S3, SNOWFLAKE, REDSHIFT };

enum class LogDomain { CONFIGURATION, DESTINATION, TRANSFER };

enum class LogAction { CREATE, UPDATE, DELETE };

std::string transferStatusToString(TransferStatus status);
TransferStatus stringToTransferStatus(const std::string &str);
bool isTerminal(TransferStatus status);

std::string dbEngineToString(DbEngine engine);
DbEngine stringToDbEngine(const std::string &str);

std::string destinationTypeToString(DestinationType type);
DestinationType stringToDestinationType(const std::string &str);

std::string logDomainToString(LogDomain domain);
std::string logActionToString(LogAction action);

struct Transfer {
  int64_t id = 0;
  TransferStatus status = TransferStatus::STARTED;
  int64_t shareId = 0;
};

struct ViewColumn {
  int64_t id = 0;
  std::string name;
  std::string dataType;
  bool isLastModified = false;
  bool isTenantColumn = false;
  bool isPrimaryKey = false;
};

struct Source {
  int64_t id = 0;
  std::string host;
  int port = 0;
  std::string username;
  std::string password;
  std::string database;
  DbEngine engine = DbEngine::POSTGRES;
};

struct View {
  int64_t id = 0;
  std::string tableName;
  std::vector<ViewColumn> columns;
  Source source;
};

struct ConfigurationColumn {
  std::string nameInSource;
  std::string nameInDestination;
  ViewColumn viewColumn;
};

struct Configuration {
  int64_t id = 0;
  std::vector<ConfigurationColumn> columns;
  View view;
};

struct Destination {
  int64_t id = 0;
  std::string nickname;
  DestinationType destinationType = DestinationType::PROVISIONED_S3;
  std::optional<std::string> host;
  std::optional<int> port;
  std::optional<std::string> username;
  std::optional<std::string> password;
  std::optional<std::string> database;
  std::optional<std::string> schema;
  std::optional<std::string> warehouse;
};

struct Share {
  int64_t id = 0;
  std::string tenantId;
  Destination destination;
  std::optional<Configuration> configuration;
  std::optional<Timestamp> lastModifiedAt;
};

// Everything processTransfer needs, loaded in one read.
struct TransferGraph {
  Transfer transfer;
  Share share;
};

struct TransferResult {
  int64_t transferId = 0;
  Timestamp finalizedAt;
  std::optional<std::string> objectUrl;
};

struct TransferSnapshot {
  Transfer transfer;
  std::optional<TransferResult> result;
};

struct Webhook {
  int64_t id = 0;
  std::string url;
  std::string secretKey;
};

struct LogEntry {
  LogDomain domain = LogDomain::TRANSFER;
  LogAction action = LogAction::UPDATE;
  int64_t domainId = 0;
  std::string message;
};

#endif
