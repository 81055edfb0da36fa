#ifndef MYSQL_CONNECTION_H
#define MYSQL_CONNECTION_H

#include "engines/connection_provider.h"
#include <mysql/mysql.h>

class MySqlConnection : public IDatabaseConnection {
  MYSQL *conn_{nullptr};

  [[noreturn]] void throwError(const std::string &context);

public:
  // Throws ConnectivityError when the server cannot be reached.
  explicit MySqlConnection(const ConnectionRequest &request);
  ~MySqlConnection() override;

  MySqlConnection(const MySqlConnection &) = delete;
  MySqlConnection &operator=(const MySqlConnection &) = delete;

  DbEngine engine() const override { return DbEngine::MYSQL; }
  QueryRows query(const std::string &sql) override;
  std::unique_ptr<IRowStream> queryStream(const std::string &sql,
                                          size_t batchSize) override;
  uint64_t queryUnsafe(const std::string &sql) override;
};

// Unbuffered result (mysql_use_result): rows are pulled from the socket one
// at a time. Freeing the result drains whatever was not read.
class MySqlRowStream : public IRowStream {
  MYSQL *conn_;
  MYSQL_RES *result_;
  unsigned int fieldCount_;
  std::vector<std::string> columns_;

public:
  MySqlRowStream(MYSQL *conn, MYSQL_RES *result);
  ~MySqlRowStream() override;

  MySqlRowStream(const MySqlRowStream &) = delete;
  MySqlRowStream &operator=(const MySqlRowStream &) = delete;

  const std::vector<std::string> &columns() const override { return columns_; }
  bool next(SqlRow &row) override;
};

#endif
