#include "loaders/warehouse_loader.h"
#include "utils/string_utils.h"

std::string SnowflakeLoader::quoteIdentifier(const std::string &identifier) const {
  return "\"" + StringUtils::replaceAll(identifier, "\"", "\"\"") + "\"";
}

std::string SnowflakeLoader::normalizeName(const std::string &name) const {
  return StringUtils::toUpper(StringUtils::unqualifiedName(name));
}

std::string SnowflakeLoader::mapDataType(const std::string &dataType) const {
  std::string upperType = StringUtils::toUpper(dataType);

  if (upperType.find("TIMESTAMPTZ") != std::string::npos ||
      upperType.find("WITH TIME ZONE") != std::string::npos) {
    return "TIMESTAMP_TZ";
  }
  if (upperType.find("TIMESTAMP") != std::string::npos ||
      upperType.find("DATETIME") != std::string::npos) {
    return "TIMESTAMP_NTZ";
  }
  if (upperType.find("DATE") != std::string::npos) {
    return "DATE";
  }
  if (upperType.find("BIGINT") != std::string::npos) {
    return "BIGINT";
  }
  if (upperType.find("INT") != std::string::npos) {
    return "INTEGER";
  }
  if (upperType.find("DECIMAL") != std::string::npos ||
      upperType.find("NUMERIC") != std::string::npos) {
    return "NUMBER(38,2)";
  }
  if (upperType.find("DOUBLE") != std::string::npos ||
      upperType.find("FLOAT") != std::string::npos ||
      upperType.find("REAL") != std::string::npos) {
    return "FLOAT";
  }
  if (upperType.find("BOOL") != std::string::npos) {
    return "BOOLEAN";
  }
  if (upperType.find("JSON") != std::string::npos) {
    return "VARIANT";
  }
  return "VARCHAR";
}

std::string SnowflakeLoader::createStagingTableSql() const {
  return "CREATE TEMPORARY TABLE " + quoteIdentifier(stagingTable_) + " LIKE " +
         qualifiedTarget();
}

std::string SnowflakeLoader::copySql(const std::string &objectLocation) const {
  StorageCredentials creds = staging_->credentials();
  return "COPY INTO " + quoteIdentifier(stagingTable_) + " (" + columnList() +
         ") FROM " + quoteValue(objectLocation) +
         " CREDENTIALS = (AWS_KEY_ID = " + quoteValue(creds.accessKeyId) +
         " AWS_SECRET_KEY = " + quoteValue(creds.secretAccessKey) +
         ") FILE_FORMAT = (TYPE = CSV COMPRESSION = GZIP SKIP_HEADER = 1 "
         "FIELD_OPTIONALLY_ENCLOSED_BY = '\"' EMPTY_FIELD_AS_NULL = TRUE "
         "SKIP_BYTE_ORDER_MARK = TRUE)";
}

std::vector<std::string> SnowflakeLoader::upsertSql() const {
  const TableTarget &t = target();
  std::string staging = quoteIdentifier(stagingTable_);

  if (t.keyColumns.empty()) {
    return {"INSERT INTO " + qualifiedTarget() + " (" + columnList() +
            ") SELECT " + columnList() + " FROM " + staging};
  }

  std::string sql = "MERGE INTO " + qualifiedTarget() + " AS target USING " +
                    staging + " AS source ON ";
  for (size_t i = 0; i < t.keyColumns.size(); ++i) {
    if (i > 0)
      sql += " AND ";
    sql += "target." + quoteIdentifier(t.keyColumns[i]) + " = source." +
           quoteIdentifier(t.keyColumns[i]);
  }

  std::vector<std::string> updates = nonKeyColumns();
  if (!updates.empty()) {
    sql += " WHEN MATCHED THEN UPDATE SET ";
    for (size_t i = 0; i < updates.size(); ++i) {
      if (i > 0)
        sql += ", ";
      sql += "target." + quoteIdentifier(updates[i]) + " = source." +
             quoteIdentifier(updates[i]);
    }
  }

  sql += " WHEN NOT MATCHED THEN INSERT (" + columnList() + ") VALUES (" +
         columnList("source.") + ")";
  return {sql};
}
