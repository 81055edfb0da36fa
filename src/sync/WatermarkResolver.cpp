#include "sync/WatermarkResolver.h"
#include "core/errors.h"
#include "core/logger.h"

Discriminators WatermarkResolver::discriminatorsFor(const View &view) {
  const ViewColumn *tenant = nullptr;
  const ViewColumn *lastModified = nullptr;

  for (const auto &column : view.columns) {
    if (column.isTenantColumn) {
      if (tenant) {
        throw ConfigurationError("View " + std::to_string(view.id) +
                                 " has more than one tenant column");
      }
      tenant = &column;
    }
    if (column.isLastModified) {
      if (lastModified) {
        throw ConfigurationError("View " + std::to_string(view.id) +
                                 " has more than one lastModified column");
      }
      lastModified = &column;
    }
  }

  if (!lastModified) {
    throw ConfigurationError("Missing lastModified column for view " +
                             std::to_string(view.id));
  }
  if (!tenant) {
    throw ConfigurationError("Missing tenant column for view " +
                             std::to_string(view.id));
  }
  return {tenant->name, lastModified->name};
}

SelectQuery WatermarkResolver::buildQuery(const View &view,
                                          const std::string &tenantId) {
  Discriminators d = discriminatorsFor(view);

  SelectQuery query;
  query.columns.push_back({d.lastModifiedColumn, ""});
  query.table = view.tableName;
  query.where.push_back(
      {d.tenantColumn, CompareOp::EQUAL, SqlLiteral::ofText(tenantId)});
  query.where.push_back({d.lastModifiedColumn, CompareOp::IS_NOT_NULL, {}});
  query.orderBy = d.lastModifiedColumn;
  query.sortOrder = SortOrder::DESC;
  query.limit = 1;
  return query;
}

std::optional<Timestamp>
WatermarkResolver::resolve(IDatabaseConnection &connection, const View &view,
                           const std::string &tenantId) {
  auto dialect = SqlDialectFactory::create(connection.engine());
  std::string sql = dialect->render(buildQuery(view, tenantId));

  QueryRows result = connection.query(sql);
  if (result.rows.empty() || result.rows[0].empty() || !result.rows[0][0]) {
    Logger::warning(LogCategory::TRANSFER, "WatermarkResolver::resolve",
                    "Zero rows returned by lastModified query: " + sql);
    return std::nullopt;
  }

  const std::string &raw = *result.rows[0][0];
  auto parsed = TimeUtils::parseIso8601(raw);
  if (!parsed) {
    throw WatermarkParseError("lastModified value '" + raw + "' of view " +
                              std::to_string(view.id) +
                              " is not an ISO-8601 timestamp");
  }
  return parsed;
}
