#include "catalog/catalog_models.h"
#include "core/errors.h"

std::string transferStatusToString(TransferStatus status) {
  switch (status) {
  case TransferStatus::STARTED:
    return "STARTED";
  case TransferStatus::PENDING:
    return "PENDING";
  case TransferStatus::COMPLETE:
    return "COMPLETE";
  case TransferStatus::FAILED:
    return "FAILED";
  case TransferStatus::CANCELLED:
    return "CANCELLED";
  }
  return "UNKNOWN";
}

TransferStatus stringToTransferStatus(const std::string &str) {
  if (str == "STARTED")
    return TransferStatus::STARTED;
  if (str == "PENDING")
    return TransferStatus::PENDING;
  if (str == "COMPLETE")
    return TransferStatus::COMPLETE;
  if (str == "FAILED")
    return TransferStatus::FAILED;
  if (str == "CANCELLED")
    return TransferStatus::CANCELLED;
  throw std::invalid_argument("Unknown transfer status: " + str);
}

bool isTerminal(TransferStatus status) {
  return status == TransferStatus::COMPLETE ||
         status == TransferStatus::FAILED ||
         status == TransferStatus::CANCELLED;
}

std::string dbEngineToString(DbEngine engine) {
  switch (engine) {
  case DbEngine::POSTGRES:
    return "POSTGRES";
  case DbEngine::MYSQL:
    return "MYSQL";
  case DbEngine::REDSHIFT:
    return "REDSHIFT";
  case DbEngine::SNOWFLAKE:
    return "SNOWFLAKE";
  }
  return "UNKNOWN";
}

DbEngine stringToDbEngine(const std::string &str) {
  if (str == "POSTGRES")
    return DbEngine::POSTGRES;
  if (str == "MYSQL")
    return DbEngine::MYSQL;
  if (str == "REDSHIFT")
    return DbEngine::REDSHIFT;
  if (str == "SNOWFLAKE")
    return DbEngine::SNOWFLAKE;
  throw ConfigurationError("Unknown source engine: " + str);
}

std::string destinationTypeToString(DestinationType type) {
  switch (type) {
  case DestinationType::PROVISIONED_S3:
    return "PROVISIONED_S3";
  case DestinationType::SNOWFLAKE:
    return "SNOWFLAKE";
  case DestinationType::REDSHIFT:
    return "REDSHIFT";
  }
  return "UNKNOWN";
}

DestinationType stringToDestinationType(const std::string &str) {
  if (str == "PROVISIONED_S3")
    return DestinationType::PROVISIONED_S3;
  if (str == "SNOWFLAKE")
    return DestinationType::SNOWFLAKE;
  if (str == "REDSHIFT")
    return DestinationType::REDSHIFT;
  throw ConfigurationError("Unknown destination type: " + str);
}

std::string logDomainToString(LogDomain domain) {
  switch (domain) {
  case LogDomain::CONFIGURATION:
    return "CONFIGURATION";
  case LogDomain::DESTINATION:
    return "DESTINATION";
  case LogDomain::TRANSFER:
    return "TRANSFER";
  }
  return "UNKNOWN";
}

std::string logActionToString(LogAction action) {
  switch (action) {
  case LogAction::CREATE:
    return "CREATE";
  case LogAction::UPDATE:
    return "UPDATE";
  case LogAction::DELETE:
    return "DELETE";
  }
  return "UNKNOWN";
}
