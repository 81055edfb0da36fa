#ifndef WATERMARK_RESOLVER_H
#define WATERMARK_RESOLVER_H

#include "engines/database_connection.h"
#include "engines/sql_dialect.h"
#include <optional>
#include <string>

struct Discriminators {
  std::string tenantColumn;
  std::string lastModifiedColumn;
};

class WatermarkResolver {
public:
  // Throws ConfigurationError unless the view has exactly one tenant column
  // and exactly one last-modified column.
  static Discriminators discriminatorsFor(const View &view);

  // Latest non-null last-modified value for the tenant, newest first,
  // limited to one row.
  static SelectQuery buildQuery(const View &view, const std::string &tenantId);

  // nullopt when the tenant has no rows. Throws WatermarkParseError when
  // the value is not an ISO-8601 timestamp.
  std::optional<Timestamp> resolve(IDatabaseConnection &connection,
                                   const View &view,
                                   const std::string &tenantId);
};

#endif
