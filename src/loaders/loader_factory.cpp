#include "loaders/loader_factory.h"
#include "core/errors.h"
#include "core/logger.h"
#include "loaders/object_store_loader.h"
#include "loaders/warehouse_loader.h"

namespace {
bool missing(const std::optional<std::string> &value) {
  return !value || value->empty();
}
} // namespace

DefaultLoaderFactory::DefaultLoaderFactory(
    IConnectionProvider &connections,
    std::shared_ptr<IObjectStorage> exportStorage,
    std::shared_ptr<IObjectStorage> stagingStorage)
    : connections_(connections), exportStorage_(std::move(exportStorage)),
      stagingStorage_(std::move(stagingStorage)) {}

void DefaultLoaderFactory::validateWarehouseCredentials(
    const Destination &destination) {
  std::string absent;
  auto note = [&absent](bool isMissing, const char *field) {
    if (isMissing)
      absent += absent.empty() ? field : std::string(", ") + field;
  };
  note(missing(destination.host), "host");
  note(!destination.port || *destination.port <= 0, "port");
  note(missing(destination.username), "username");
  note(missing(destination.password), "password");
  note(missing(destination.database), "database");
  note(missing(destination.schema), "schema");

  if (!absent.empty()) {
    Logger::error(LogCategory::VALIDATION,
                  "DefaultLoaderFactory::validateWarehouseCredentials",
                  "Destination " + std::to_string(destination.id) +
                      " is missing " + absent);
    throw ConfigurationError("Incomplete credentials for destination with ID " +
                             std::to_string(destination.id) + ": missing " +
                             absent);
  }
}

std::unique_ptr<IDestinationLoader>
DefaultLoaderFactory::open(const Destination &destination) {
  if (destination.destinationType == DestinationType::PROVISIONED_S3) {
    return std::make_unique<ObjectStoreLoader>(exportStorage_);
  }

  validateWarehouseCredentials(destination);

  ConnectionRequest request;
  request.engine = destination.destinationType == DestinationType::SNOWFLAKE
                       ? DbEngine::SNOWFLAKE
                       : DbEngine::REDSHIFT;
  request.host = *destination.host;
  request.port = *destination.port;
  request.username = *destination.username;
  request.password = *destination.password;
  request.database = *destination.database;
  request.schema = destination.schema;
  request.warehouse = destination.warehouse;

  ConnectionResult result = connections_.connect(request);
  if (result.status != ConnectionStatus::REACHABLE || !result.connection) {
    throw ConnectivityError("Destination with ID " +
                            std::to_string(destination.id) +
                            " is unreachable: " + result.message);
  }

  Logger::info(LogCategory::WAREHOUSE, "DefaultLoaderFactory::open",
               "Connected to " + destinationTypeToString(destination.destinationType) +
                   " destination " + std::to_string(destination.id));

  if (destination.destinationType == DestinationType::SNOWFLAKE) {
    return std::make_unique<SnowflakeLoader>(std::move(result.connection),
                                             stagingStorage_);
  }
  return std::make_unique<RedshiftLoader>(std::move(result.connection),
                                          stagingStorage_);
}
