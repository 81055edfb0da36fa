#ifndef SNOWFLAKE_CONNECTION_H
#define SNOWFLAKE_CONNECTION_H

#include "engines/connection_provider.h"
#include <sql.h>
#include <sqlext.h>

// Snowflake over the ODBC driver manager. Autocommit stays on; an explicit
// BEGIN sent through queryUnsafe opens a transaction that lasts until
// COMMIT or ROLLBACK.
class SnowflakeConnection : public IDatabaseConnection {
  SQLHENV env_ = SQL_NULL_HANDLE;
  SQLHDBC dbc_ = SQL_NULL_HANDLE;

  void cleanup();

public:
  // Throws ConnectivityError when the driver cannot connect.
  explicit SnowflakeConnection(const ConnectionRequest &request);
  ~SnowflakeConnection() override;

  SnowflakeConnection(const SnowflakeConnection &) = delete;
  SnowflakeConnection &operator=(const SnowflakeConnection &) = delete;

  DbEngine engine() const override { return DbEngine::SNOWFLAKE; }
  QueryRows query(const std::string &sql) override;
  std::unique_ptr<IRowStream> queryStream(const std::string &sql,
                                          size_t batchSize) override;
  uint64_t queryUnsafe(const std::string &sql) override;

  static std::string buildConnectionString(const ConnectionRequest &request);
};

class SnowflakeRowStream : public IRowStream {
  SQLHSTMT stmt_;
  SQLSMALLINT columnCount_ = 0;
  std::vector<std::string> columns_;

public:
  SnowflakeRowStream(SQLHDBC dbc, const std::string &sql);
  ~SnowflakeRowStream() override;

  SnowflakeRowStream(const SnowflakeRowStream &) = delete;
  SnowflakeRowStream &operator=(const SnowflakeRowStream &) = delete;

  const std::vector<std::string> &columns() const override { return columns_; }
  bool next(SqlRow &row) override;
};

#endif
