#include "engines/mysql_connection.h"
#include "core/errors.h"
#include "core/logger.h"

namespace {
constexpr unsigned int CONNECT_TIMEOUT_SECONDS = 30;
constexpr unsigned int READ_WRITE_TIMEOUT_SECONDS = 600;

SqlRow toSqlRow(MYSQL_ROW row, unsigned long *lengths, unsigned int count) {
  SqlRow out;
  out.reserve(count);
  for (unsigned int i = 0; i < count; ++i) {
    if (row[i] == nullptr)
      out.emplace_back(std::nullopt);
    else
      out.emplace_back(std::string(row[i], lengths[i]));
  }
  return out;
}

std::vector<std::string> fieldNames(MYSQL_RES *result) {
  std::vector<std::string> names;
  unsigned int count = mysql_num_fields(result);
  MYSQL_FIELD *fields = mysql_fetch_fields(result);
  for (unsigned int i = 0; i < count; ++i)
    names.emplace_back(fields[i].name);
  return names;
}
} // namespace

MySqlConnection::MySqlConnection(const ConnectionRequest &request) {
  conn_ = mysql_init(nullptr);
  if (!conn_) {
    throw ConnectivityError("mysql_init() failed");
  }

  unsigned int connectTimeout = CONNECT_TIMEOUT_SECONDS;
  unsigned int ioTimeout = READ_WRITE_TIMEOUT_SECONDS;
  mysql_options(conn_, MYSQL_OPT_CONNECT_TIMEOUT, &connectTimeout);
  mysql_options(conn_, MYSQL_OPT_READ_TIMEOUT, &ioTimeout);
  mysql_options(conn_, MYSQL_OPT_WRITE_TIMEOUT, &ioTimeout);
  mysql_options(conn_, MYSQL_SET_CHARSET_NAME, "utf8mb4");

  if (mysql_real_connect(conn_, request.host.c_str(), request.username.c_str(),
                         request.password.c_str(), request.database.c_str(),
                         static_cast<unsigned int>(request.port), nullptr,
                         0) == nullptr) {
    std::string error = mysql_error(conn_);
    mysql_close(conn_);
    conn_ = nullptr;
    throw ConnectivityError("Connection failed: " + error);
  }

  if (mysql_query(conn_, "SET time_zone = '+00:00'")) {
    Logger::warning(LogCategory::DATABASE, "MySqlConnection",
                    "Failed to set session time zone: " +
                        std::string(mysql_error(conn_)));
  }
}

MySqlConnection::~MySqlConnection() {
  if (conn_)
    mysql_close(conn_);
}

void MySqlConnection::throwError(const std::string &context) {
  throw std::runtime_error(context + ": " + std::string(mysql_error(conn_)));
}

QueryRows MySqlConnection::query(const std::string &sql) {
  if (mysql_query(conn_, sql.c_str()))
    throwError("Query failed");

  QueryRows rows;
  MYSQL_RES *result = mysql_store_result(conn_);
  if (!result) {
    if (mysql_field_count(conn_) != 0)
      throwError("Failed to read result");
    return rows;
  }

  rows.columns = fieldNames(result);
  unsigned int count = mysql_num_fields(result);
  MYSQL_ROW row;
  while ((row = mysql_fetch_row(result))) {
    rows.rows.push_back(toSqlRow(row, mysql_fetch_lengths(result), count));
  }
  mysql_free_result(result);
  return rows;
}

std::unique_ptr<IRowStream> MySqlConnection::queryStream(const std::string &sql,
                                                         size_t) {
  if (mysql_query(conn_, sql.c_str()))
    throwError("Query failed");

  MYSQL_RES *result = mysql_use_result(conn_);
  if (!result)
    throwError("Failed to open result stream");
  return std::make_unique<MySqlRowStream>(conn_, result);
}

uint64_t MySqlConnection::queryUnsafe(const std::string &sql) {
  if (mysql_query(conn_, sql.c_str()))
    throwError("Statement failed");

  MYSQL_RES *result = mysql_store_result(conn_);
  if (result) {
    uint64_t count = mysql_num_rows(result);
    mysql_free_result(result);
    return count;
  }
  return mysql_affected_rows(conn_);
}

MySqlRowStream::MySqlRowStream(MYSQL *conn, MYSQL_RES *result)
    : conn_(conn), result_(result), fieldCount_(mysql_num_fields(result)),
      columns_(fieldNames(result)) {}

MySqlRowStream::~MySqlRowStream() {
  if (result_)
    mysql_free_result(result_);
}

bool MySqlRowStream::next(SqlRow &row) {
  if (!result_)
    return false;

  MYSQL_ROW raw = mysql_fetch_row(result_);
  if (!raw) {
    // mysql_fetch_row returns NULL both at the end and on a network error.
    if (mysql_errno(conn_) != 0) {
      throw std::runtime_error("Row stream failed: " +
                               std::string(mysql_error(conn_)));
    }
    mysql_free_result(result_);
    result_ = nullptr;
    return false;
  }
  row = toSqlRow(raw, mysql_fetch_lengths(result_), fieldCount_);
  return true;
}
