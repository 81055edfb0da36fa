#ifndef POSTGRES_CONNECTION_H
#define POSTGRES_CONNECTION_H

#include "engines/connection_provider.h"
#include <memory>
#include <pqxx/pqxx>

// libpqxx connection used for PostgreSQL sources and Redshift (which speaks
// the PostgreSQL wire protocol).
class PostgresConnection : public IDatabaseConnection {
  DbEngine engine_;
  std::unique_ptr<pqxx::connection> conn_;

public:
  // Throws ConnectivityError when the server cannot be reached.
  explicit PostgresConnection(const ConnectionRequest &request);

  DbEngine engine() const override { return engine_; }
  QueryRows query(const std::string &sql) override;
  std::unique_ptr<IRowStream> queryStream(const std::string &sql,
                                          size_t batchSize) override;
  uint64_t queryUnsafe(const std::string &sql) override;

  static std::string buildConnectionString(const ConnectionRequest &request);
};

// Server-side cursor read in FETCH FORWARD batches inside its own
// transaction, so at most one batch is held in memory.
class PostgresRowStream : public IRowStream {
  std::unique_ptr<pqxx::work> txn_;
  std::string cursorName_;
  size_t batchSize_;
  pqxx::result batch_;
  pqxx::result::size_type position_ = 0;
  bool exhausted_ = false;
  std::vector<std::string> columns_;

  void fetchBatch();

public:
  PostgresRowStream(pqxx::connection &conn, const std::string &sql,
                    size_t batchSize);

  const std::vector<std::string> &columns() const override { return columns_; }
  bool next(SqlRow &row) override;
};

#endif
