#ifndef SQL_DIALECT_H
#define SQL_DIALECT_H

#include "catalog/catalog_models.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct SqlLiteral {
  enum class Kind { TEXT, TIMESTAMP };

  Kind kind = Kind::TEXT;
  std::string text;
  Timestamp timestamp;

  static SqlLiteral ofText(std::string value) {
    SqlLiteral literal;
    literal.kind = Kind::TEXT;
    literal.text = std::move(value);
    return literal;
  }

  static SqlLiteral ofTimestamp(Timestamp value) {
    SqlLiteral literal;
    literal.kind = Kind::TIMESTAMP;
    literal.timestamp = value;
    return literal;
  }
};

enum class CompareOp { EQUAL, GREATER_THAN, IS_NOT_NULL };

struct WhereCondition {
  std::string column;
  CompareOp op = CompareOp::EQUAL;
  std::optional<SqlLiteral> value;
};

struct SelectColumn {
  std::string name;
  std::string alias;
};

enum class SortOrder { ASC, DESC };

// Provider-neutral SELECT. Exactly one of table / subquery is the source.
// Conditions are ANDed.
struct SelectQuery {
  std::vector<SelectColumn> columns;
  std::string table;
  std::shared_ptr<SelectQuery> subquery;
  std::string subqueryAlias;
  std::vector<WhereCondition> where;
  std::optional<std::string> orderBy;
  SortOrder sortOrder = SortOrder::ASC;
  std::optional<size_t> limit;
};

class ISqlDialect {
public:
  virtual ~ISqlDialect() = default;

  // "schema.table" is quoted part by part.
  virtual std::string quoteIdentifier(const std::string &name) const = 0;
  virtual std::string quoteLiteral(const std::string &value) const = 0;
  virtual std::string timestampLiteral(Timestamp value) const = 0;
  virtual std::string render(const SelectQuery &query) const = 0;
};

// Shared rendering; subclasses only decide quoting and literal syntax.
class SqlDialect : public ISqlDialect {
protected:
  virtual std::string quotePart(const std::string &part) const = 0;
  std::string renderLiteral(const SqlLiteral &literal) const;
  std::string renderCondition(const WhereCondition &condition) const;

public:
  std::string quoteIdentifier(const std::string &name) const override;
  std::string quoteLiteral(const std::string &value) const override;
  std::string render(const SelectQuery &query) const override;
};

// PostgreSQL and Redshift.
class PostgresDialect : public SqlDialect {
protected:
  std::string quotePart(const std::string &part) const override;

public:
  std::string timestampLiteral(Timestamp value) const override;
};

class MySqlDialect : public SqlDialect {
protected:
  std::string quotePart(const std::string &part) const override;

public:
  std::string quoteLiteral(const std::string &value) const override;
  std::string timestampLiteral(Timestamp value) const override;
};

class SnowflakeDialect : public SqlDialect {
protected:
  std::string quotePart(const std::string &part) const override;

public:
  std::string timestampLiteral(Timestamp value) const override;
};

namespace SqlDialectFactory {
std::unique_ptr<ISqlDialect> create(DbEngine engine);
} // namespace SqlDialectFactory

#endif
