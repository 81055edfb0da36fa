#ifndef CONNECTION_PROVIDER_H
#define CONNECTION_PROVIDER_H

#include "engines/database_connection.h"
#include <memory>
#include <optional>
#include <string>

struct ConnectionRequest {
  DbEngine engine = DbEngine::POSTGRES;
  std::string host;
  int port = 0;
  std::string username;
  std::string password;
  std::string database;
  std::optional<std::string> schema;
  std::optional<std::string> warehouse;
};

enum class ConnectionStatus { REACHABLE, UNREACHABLE };

struct ConnectionResult {
  ConnectionStatus status = ConnectionStatus::UNREACHABLE;
  std::unique_ptr<IDatabaseConnection> connection;
  std::string message;
};

class IConnectionProvider {
public:
  virtual ~IConnectionProvider() = default;

  // Never throws for an unreachable server; that is reported through the
  // result so callers can decide how to classify it.
  virtual ConnectionResult connect(const ConnectionRequest &request) = 0;
};

// Dispatches to libpqxx (POSTGRES, REDSHIFT), the MySQL client library
// (MYSQL) or ODBC (SNOWFLAKE).
class DefaultConnectionProvider : public IConnectionProvider {
public:
  ConnectionResult connect(const ConnectionRequest &request) override;
};

#endif
