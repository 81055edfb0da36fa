#include "engines/postgres_connection.h"
#include "core/errors.h"
#include "core/logger.h"

namespace {
constexpr int CONNECT_TIMEOUT_SECONDS = 30;
constexpr const char *CURSOR_NAME = "sharesync_extract";

std::string quoteParam(const std::string &value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'' || c == '\\')
      quoted += '\\';
    quoted += c;
  }
  quoted += "'";
  return quoted;
}

SqlRow toSqlRow(const pqxx::row &row) {
  SqlRow out;
  out.reserve(row.size());
  for (const auto &field : row) {
    if (field.is_null())
      out.emplace_back(std::nullopt);
    else
      out.emplace_back(std::string(field.c_str(), field.size()));
  }
  return out;
}
} // namespace

std::string
PostgresConnection::buildConnectionString(const ConnectionRequest &request) {
  std::string connStr = "host=" + quoteParam(request.host) +
                        " port=" + std::to_string(request.port) +
                        " dbname=" + quoteParam(request.database) +
                        " user=" + quoteParam(request.username) +
                        " password=" + quoteParam(request.password) +
                        " connect_timeout=" +
                        std::to_string(CONNECT_TIMEOUT_SECONDS);
  if (request.engine == DbEngine::REDSHIFT)
    connStr += " sslmode=require";
  return connStr;
}

PostgresConnection::PostgresConnection(const ConnectionRequest &request)
    : engine_(request.engine) {
  try {
    conn_ = std::make_unique<pqxx::connection>(buildConnectionString(request));
    // Timestamps come back in UTC so they parse without session context.
    pqxx::nontransaction txn(*conn_);
    txn.exec("SET TIME ZONE 'UTC'");
  } catch (const pqxx::broken_connection &e) {
    throw ConnectivityError(e.what());
  } catch (const pqxx::sql_error &e) {
    throw ConnectivityError(e.what());
  }
}

QueryRows PostgresConnection::query(const std::string &sql) {
  pqxx::nontransaction txn(*conn_);
  pqxx::result result = txn.exec(sql);

  QueryRows rows;
  for (pqxx::row::size_type i = 0; i < result.columns(); ++i)
    rows.columns.push_back(result.column_name(i));
  for (const auto &row : result)
    rows.rows.push_back(toSqlRow(row));
  return rows;
}

std::unique_ptr<IRowStream>
PostgresConnection::queryStream(const std::string &sql, size_t batchSize) {
  return std::make_unique<PostgresRowStream>(*conn_, sql, batchSize);
}

uint64_t PostgresConnection::queryUnsafe(const std::string &sql) {
  pqxx::nontransaction txn(*conn_);
  pqxx::result result = txn.exec(sql);
  return result.affected_rows();
}

PostgresRowStream::PostgresRowStream(pqxx::connection &conn,
                                     const std::string &sql, size_t batchSize)
    : txn_(std::make_unique<pqxx::work>(conn)), cursorName_(CURSOR_NAME),
      batchSize_(batchSize) {
  txn_->exec("DECLARE " + cursorName_ + " CURSOR FOR " + sql);
  fetchBatch();
  for (pqxx::row::size_type i = 0; i < batch_.columns(); ++i)
    columns_.push_back(batch_.column_name(i));
}

void PostgresRowStream::fetchBatch() {
  batch_ = txn_->exec("FETCH FORWARD " + std::to_string(batchSize_) +
                      " FROM " + cursorName_);
  position_ = 0;
  if (batch_.size() < batchSize_)
    exhausted_ = true;
}

bool PostgresRowStream::next(SqlRow &row) {
  if (position_ >= batch_.size()) {
    if (exhausted_) {
      // Read-only transaction; closing it releases the cursor.
      if (txn_) {
        txn_->commit();
        txn_.reset();
      }
      return false;
    }
    fetchBatch();
    if (batch_.empty())
      return next(row);
  }
  row = toSqlRow(batch_[position_++]);
  return true;
}
