#include "engines/connection_provider.h"
#include "core/errors.h"
#include "core/logger.h"
#include "engines/mysql_connection.h"
#include "engines/postgres_connection.h"
#include "engines/snowflake_connection.h"

ConnectionResult
DefaultConnectionProvider::connect(const ConnectionRequest &request) {
  ConnectionResult result;
  try {
    switch (request.engine) {
    case DbEngine::POSTGRES:
    case DbEngine::REDSHIFT:
      result.connection = std::make_unique<PostgresConnection>(request);
      break;
    case DbEngine::MYSQL:
      result.connection = std::make_unique<MySqlConnection>(request);
      break;
    case DbEngine::SNOWFLAKE:
      result.connection = std::make_unique<SnowflakeConnection>(request);
      break;
    }
    result.status = ConnectionStatus::REACHABLE;
  } catch (const ConnectivityError &e) {
    Logger::warning(LogCategory::DATABASE, "DefaultConnectionProvider::connect",
                    dbEngineToString(request.engine) + " at " + request.host +
                        ":" + std::to_string(request.port) +
                        " is unreachable: " + std::string(e.what()));
    result.status = ConnectionStatus::UNREACHABLE;
    result.message = e.what();
  }
  return result;
}
