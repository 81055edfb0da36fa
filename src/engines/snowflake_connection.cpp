#include "engines/snowflake_connection.h"
#include "core/errors.h"
#include "core/logger.h"

namespace {

constexpr SQLULEN LOGIN_TIMEOUT_SECONDS = 30;

// ODBC attribute value in braces, so ';' and '=' are literal. A closing
// brace inside the value is written twice.
std::string braced(const std::string &value) {
  std::string out = "{";
  for (char c : value) {
    out += c;
    if (c == '}')
      out += '}';
  }
  out += "}";
  return out;
}

std::string diagnostic(SQLSMALLINT handleType, SQLHANDLE handle) {
  SQLCHAR sqlState[6], msg[SQL_MAX_MESSAGE_LENGTH];
  SQLINTEGER nativeError;
  SQLSMALLINT msgLen;
  if (SQL_SUCCEEDED(SQLGetDiagRec(handleType, handle, 1, sqlState,
                                  &nativeError, msg, sizeof(msg), &msgLen))) {
    return std::string(reinterpret_cast<char *>(msg));
  }
  return "unknown ODBC error";
}

SQLHSTMT execute(SQLHDBC dbc, const std::string &sql) {
  SQLHSTMT stmt;
  SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, dbc, &stmt);
  if (!SQL_SUCCEEDED(ret)) {
    throw std::runtime_error("Failed to allocate statement handle");
  }

  ret = SQLExecDirect(stmt, (SQLCHAR *)sql.c_str(), SQL_NTS);
  if (!SQL_SUCCEEDED(ret) && ret != SQL_NO_DATA) {
    std::string error = diagnostic(SQL_HANDLE_STMT, stmt);
    SQLFreeHandle(SQL_HANDLE_STMT, stmt);
    throw std::runtime_error("Query execution failed: " + error);
  }
  return stmt;
}

std::vector<std::string> columnNames(SQLHSTMT stmt, SQLSMALLINT count) {
  std::vector<std::string> names;
  for (SQLSMALLINT i = 1; i <= count; ++i) {
    SQLCHAR name[256];
    SQLSMALLINT nameLen = 0, dataType, decimalDigits, nullable;
    SQLULEN columnSize;
    SQLDescribeCol(stmt, i, name, sizeof(name), &nameLen, &dataType,
                   &columnSize, &decimalDigits, &nullable);
    names.emplace_back(reinterpret_cast<char *>(name));
  }
  return names;
}

// Reads one column of the current row, looping over SQLGetData for values
// longer than the buffer.
SqlValue readColumn(SQLHSTMT stmt, SQLSMALLINT column) {
  std::string value;
  char buffer[4096];
  while (true) {
    SQLLEN indicator = 0;
    SQLRETURN ret =
        SQLGetData(stmt, column, SQL_C_CHAR, buffer, sizeof(buffer), &indicator);
    if (ret == SQL_NO_DATA)
      break;
    if (!SQL_SUCCEEDED(ret)) {
      throw std::runtime_error("SQLGetData failed: " +
                               diagnostic(SQL_HANDLE_STMT, stmt));
    }
    if (indicator == SQL_NULL_DATA)
      return std::nullopt;

    size_t chunk = (indicator == SQL_NO_TOTAL ||
                    indicator >= static_cast<SQLLEN>(sizeof(buffer)))
                       ? sizeof(buffer) - 1
                       : static_cast<size_t>(indicator);
    value.append(buffer, chunk);
    if (ret == SQL_SUCCESS)
      break;
  }
  return value;
}

bool fetchRow(SQLHSTMT stmt, SQLSMALLINT count, SqlRow &row) {
  SQLRETURN ret = SQLFetch(stmt);
  if (ret == SQL_NO_DATA)
    return false;
  if (!SQL_SUCCEEDED(ret)) {
    throw std::runtime_error("SQLFetch failed: " +
                             diagnostic(SQL_HANDLE_STMT, stmt));
  }
  row.clear();
  for (SQLSMALLINT i = 1; i <= count; ++i)
    row.push_back(readColumn(stmt, i));
  return true;
}

} // namespace

std::string
SnowflakeConnection::buildConnectionString(const ConnectionRequest &request) {
  std::string connStr = "DRIVER=SnowflakeDSIIDriver;SERVER=" +
                        braced(request.host) +
                        ";PORT=" + std::to_string(request.port) +
                        ";UID=" + braced(request.username) +
                        ";PWD=" + braced(request.password) +
                        ";DATABASE=" + braced(request.database);
  if (request.schema)
    connStr += ";SCHEMA=" + braced(*request.schema);
  if (request.warehouse)
    connStr += ";WAREHOUSE=" + braced(*request.warehouse);
  return connStr;
}

SnowflakeConnection::SnowflakeConnection(const ConnectionRequest &request) {
  SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env_);
  if (!SQL_SUCCEEDED(ret)) {
    throw ConnectivityError("Failed to allocate environment handle");
  }

  ret = SQLSetEnvAttr(env_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3, 0);
  if (!SQL_SUCCEEDED(ret)) {
    cleanup();
    throw ConnectivityError("Failed to set ODBC version");
  }

  ret = SQLAllocHandle(SQL_HANDLE_DBC, env_, &dbc_);
  if (!SQL_SUCCEEDED(ret)) {
    cleanup();
    throw ConnectivityError("Failed to allocate connection handle");
  }

  SQLSetConnectAttr(dbc_, SQL_ATTR_LOGIN_TIMEOUT,
                    reinterpret_cast<SQLPOINTER>(LOGIN_TIMEOUT_SECONDS), 0);

  std::string connStr = buildConnectionString(request);
  SQLCHAR outConnStr[1024];
  SQLSMALLINT outConnStrLen;
  ret = SQLDriverConnect(dbc_, nullptr, (SQLCHAR *)connStr.c_str(), SQL_NTS,
                         outConnStr, sizeof(outConnStr), &outConnStrLen,
                         SQL_DRIVER_NOPROMPT);
  if (!SQL_SUCCEEDED(ret)) {
    std::string error = diagnostic(SQL_HANDLE_DBC, dbc_);
    cleanup();
    throw ConnectivityError("Connection failed: " + error);
  }

  try {
    SQLHSTMT stmt = execute(
        dbc_, "ALTER SESSION SET TIMEZONE = 'UTC', TIMESTAMP_OUTPUT_FORMAT = "
              "'YYYY-MM-DD\"T\"HH24:MI:SS.FF6TZH:TZM'");
    SQLFreeHandle(SQL_HANDLE_STMT, stmt);
  } catch (const std::runtime_error &e) {
    cleanup();
    throw ConnectivityError(e.what());
  }
}

SnowflakeConnection::~SnowflakeConnection() { cleanup(); }

void SnowflakeConnection::cleanup() {
  if (dbc_ != SQL_NULL_HANDLE) {
    SQLDisconnect(dbc_);
    SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
    dbc_ = SQL_NULL_HANDLE;
  }
  if (env_ != SQL_NULL_HANDLE) {
    SQLFreeHandle(SQL_HANDLE_ENV, env_);
    env_ = SQL_NULL_HANDLE;
  }
}

QueryRows SnowflakeConnection::query(const std::string &sql) {
  SQLHSTMT stmt = execute(dbc_, sql);
  QueryRows rows;
  try {
    SQLSMALLINT count = 0;
    SQLNumResultCols(stmt, &count);
    rows.columns = columnNames(stmt, count);
    SqlRow row;
    while (fetchRow(stmt, count, row))
      rows.rows.push_back(row);
  } catch (const std::exception &) {
    SQLFreeHandle(SQL_HANDLE_STMT, stmt);
    throw;
  }
  SQLFreeHandle(SQL_HANDLE_STMT, stmt);
  return rows;
}

std::unique_ptr<IRowStream>
SnowflakeConnection::queryStream(const std::string &sql, size_t) {
  return std::make_unique<SnowflakeRowStream>(dbc_, sql);
}

uint64_t SnowflakeConnection::queryUnsafe(const std::string &sql) {
  SQLHSTMT stmt = execute(dbc_, sql);
  SQLLEN affected = 0;
  SQLRowCount(stmt, &affected);
  SQLFreeHandle(SQL_HANDLE_STMT, stmt);
  return affected > 0 ? static_cast<uint64_t>(affected) : 0;
}

SnowflakeRowStream::SnowflakeRowStream(SQLHDBC dbc, const std::string &sql)
    : stmt_(execute(dbc, sql)) {
  SQLNumResultCols(stmt_, &columnCount_);
  columns_ = columnNames(stmt_, columnCount_);
}

SnowflakeRowStream::~SnowflakeRowStream() {
  if (stmt_ != SQL_NULL_HANDLE)
    SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
}

bool SnowflakeRowStream::next(SqlRow &row) {
  if (stmt_ == SQL_NULL_HANDLE)
    return false;
  if (!fetchRow(stmt_, columnCount_, row)) {
    SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
    stmt_ = SQL_NULL_HANDLE;
    return false;
  }
  return true;
}
