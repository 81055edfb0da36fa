#ifndef DATABASE_CONNECTION_H
#define DATABASE_CONNECTION_H

#include "catalog/catalog_models.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// NULL is nullopt; everything else arrives in the driver's text form.
using SqlValue = std::optional<std::string>;
using SqlRow = std::vector<SqlValue>;

struct QueryRows {
  std::vector<std::string> columns;
  std::vector<SqlRow> rows;
};

// Forward-only cursor over a result set that is never fully materialized.
class IRowStream {
public:
  virtual ~IRowStream() = default;

  virtual const std::vector<std::string> &columns() const = 0;

  // Fills row and returns true, or returns false once the result is
  // exhausted. Driver errors are thrown.
  virtual bool next(SqlRow &row) = 0;
};

class IDatabaseConnection {
public:
  virtual ~IDatabaseConnection() = default;

  virtual DbEngine engine() const = 0;

  virtual QueryRows query(const std::string &sql) = 0;

  // The connection must not be used for anything else while the returned
  // stream is alive.
  virtual std::unique_ptr<IRowStream> queryStream(const std::string &sql,
                                                  size_t batchSize) = 0;

  // Raw statement execution for DDL, COPY and transaction control. Runs
  // outside any driver-managed transaction so that an explicit BEGIN
  // issued through it spans later calls. Returns affected rows.
  virtual uint64_t queryUnsafe(const std::string &sql) = 0;
};

#endif
