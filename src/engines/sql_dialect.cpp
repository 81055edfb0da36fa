#include "engines/sql_dialect.h"
#include "utils/string_utils.h"
#include <stdexcept>

std::string SqlDialect::quoteIdentifier(const std::string &name) const {
  if (name.empty()) {
    throw std::invalid_argument("Identifier cannot be empty");
  }
  std::string quoted;
  for (const auto &part : StringUtils::split(name, '.')) {
    if (part.empty()) {
      throw std::invalid_argument("Malformed qualified identifier: " + name);
    }
    if (!quoted.empty())
      quoted += ".";
    quoted += quotePart(part);
  }
  return quoted;
}

std::string SqlDialect::quoteLiteral(const std::string &value) const {
  return "'" + StringUtils::replaceAll(value, "'", "''") + "'";
}

std::string SqlDialect::renderLiteral(const SqlLiteral &literal) const {
  if (literal.kind == SqlLiteral::Kind::TIMESTAMP)
    return timestampLiteral(literal.timestamp);
  return quoteLiteral(literal.text);
}

std::string SqlDialect::renderCondition(const WhereCondition &condition) const {
  std::string column = quoteIdentifier(condition.column);
  switch (condition.op) {
  case CompareOp::IS_NOT_NULL:
    return column + " IS NOT NULL";
  case CompareOp::EQUAL:
  case CompareOp::GREATER_THAN:
    if (!condition.value) {
      throw std::invalid_argument("Comparison on " + condition.column +
                                  " has no value");
    }
    return column + (condition.op == CompareOp::EQUAL ? " = " : " > ") +
           renderLiteral(*condition.value);
  }
  throw std::invalid_argument("Unknown comparison operator");
}

std::string SqlDialect::render(const SelectQuery &query) const {
  if (query.columns.empty()) {
    throw std::invalid_argument("SELECT needs at least one column");
  }

  std::string sql = "SELECT ";
  for (size_t i = 0; i < query.columns.size(); ++i) {
    const auto &column = query.columns[i];
    if (i > 0)
      sql += ", ";
    sql += quoteIdentifier(column.name);
    if (!column.alias.empty() && column.alias != column.name)
      sql += " AS " + quoteIdentifier(column.alias);
  }

  sql += " FROM ";
  if (query.subquery) {
    sql += "(" + render(*query.subquery) + ") AS " +
           quoteIdentifier(query.subqueryAlias.empty() ? "t"
                                                       : query.subqueryAlias);
  } else {
    sql += quoteIdentifier(query.table);
  }

  for (size_t i = 0; i < query.where.size(); ++i) {
    sql += i == 0 ? " WHERE " : " AND ";
    sql += renderCondition(query.where[i]);
  }

  if (query.orderBy) {
    sql += " ORDER BY " + quoteIdentifier(*query.orderBy) +
           (query.sortOrder == SortOrder::DESC ? " DESC" : " ASC");
  }
  if (query.limit)
    sql += " LIMIT " + std::to_string(*query.limit);
  return sql;
}

std::string PostgresDialect::quotePart(const std::string &part) const {
  return "\"" + StringUtils::replaceAll(part, "\"", "\"\"") + "\"";
}

std::string PostgresDialect::timestampLiteral(Timestamp value) const {
  return "'" + TimeUtils::formatIso8601(value) + "'::timestamptz";
}

std::string MySqlDialect::quotePart(const std::string &part) const {
  return "`" + StringUtils::replaceAll(part, "`", "``") + "`";
}

// MySQL treats backslash as an escape inside string literals unless
// NO_BACKSLASH_ESCAPES is set, so both quote and backslash are escaped.
std::string MySqlDialect::quoteLiteral(const std::string &value) const {
  std::string escaped = StringUtils::replaceAll(value, "\\", "\\\\");
  return "'" + StringUtils::replaceAll(escaped, "'", "''") + "'";
}

// The session runs in UTC and DATETIME has no zone suffix.
std::string MySqlDialect::timestampLiteral(Timestamp value) const {
  return "'" + TimeUtils::formatSqlDateTime(value) + "'";
}

std::string SnowflakeDialect::quotePart(const std::string &part) const {
  return "\"" + StringUtils::replaceAll(part, "\"", "\"\"") + "\"";
}

std::string SnowflakeDialect::timestampLiteral(Timestamp value) const {
  return "'" + TimeUtils::formatIso8601(value) + "'::TIMESTAMP_TZ";
}

namespace SqlDialectFactory {

std::unique_ptr<ISqlDialect> create(DbEngine engine) {
  switch (engine) {
  case DbEngine::POSTGRES:
  case DbEngine::REDSHIFT:
    return std::make_unique<PostgresDialect>();
  case DbEngine::MYSQL:
    return std::make_unique<MySqlDialect>();
  case DbEngine::SNOWFLAKE:
    return std::make_unique<SnowflakeDialect>();
  }
  throw std::invalid_argument("Unsupported engine for SQL dialect");
}

} // namespace SqlDialectFactory
