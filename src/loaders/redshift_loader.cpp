#include "loaders/warehouse_loader.h"
#include "utils/string_utils.h"

std::string RedshiftLoader::quoteIdentifier(const std::string &identifier) const {
  return "\"" + StringUtils::replaceAll(identifier, "\"", "\"\"") + "\"";
}

std::string RedshiftLoader::normalizeName(const std::string &name) const {
  return StringUtils::toLower(StringUtils::unqualifiedName(name));
}

std::string RedshiftLoader::mapDataType(const std::string &dataType) const {
  std::string upperType = StringUtils::toUpper(dataType);

  if (upperType.find("TIMESTAMPTZ") != std::string::npos ||
      upperType.find("WITH TIME ZONE") != std::string::npos) {
    return "TIMESTAMPTZ";
  }
  if (upperType.find("TIMESTAMP") != std::string::npos ||
      upperType.find("DATETIME") != std::string::npos) {
    return "TIMESTAMP";
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
    return "DECIMAL(18,2)";
  }
  if (upperType.find("DOUBLE") != std::string::npos ||
      upperType.find("FLOAT") != std::string::npos ||
      upperType.find("REAL") != std::string::npos) {
    return "DOUBLE PRECISION";
  }
  if (upperType.find("BOOL") != std::string::npos) {
    return "BOOLEAN";
  }
  if (upperType.find("JSON") != std::string::npos) {
    return "SUPER";
  }
  return "VARCHAR(MAX)";
}

std::string RedshiftLoader::createStagingTableSql() const {
  return "CREATE TEMP TABLE " + quoteIdentifier(stagingTable_) + " (LIKE " +
         qualifiedTarget() + ")";
}

// EMPTYASNULL turns unquoted empty fields (NULL in the extract) into NULL;
// a quoted "" still loads as an empty string.
std::string RedshiftLoader::copySql(const std::string &objectLocation) const {
  StorageCredentials creds = staging_->credentials();
  return "COPY " + quoteIdentifier(stagingTable_) + " (" + columnList() +
         ") FROM " + quoteValue(objectLocation) + " CREDENTIALS " +
         quoteValue("aws_access_key_id=" + creds.accessKeyId +
                    ";aws_secret_access_key=" + creds.secretAccessKey) +
         " REGION " + quoteValue(creds.region) +
         " CSV GZIP IGNOREHEADER 1 EMPTYASNULL TIMEFORMAT 'auto' "
         "DATEFORMAT 'auto'";
}

std::vector<std::string> RedshiftLoader::upsertSql() const {
  const TableTarget &t = target();
  std::string staging = quoteIdentifier(stagingTable_);
  std::vector<std::string> statements;

  if (!t.keyColumns.empty()) {
    std::string del = "DELETE FROM " + qualifiedTarget() + " USING " + staging +
                      " WHERE ";
    for (size_t i = 0; i < t.keyColumns.size(); ++i) {
      if (i > 0)
        del += " AND ";
      del += qualifiedTarget() + "." + quoteIdentifier(t.keyColumns[i]) +
             " = " + staging + "." + quoteIdentifier(t.keyColumns[i]);
    }
    statements.push_back(del);
  }

  statements.push_back("INSERT INTO " + qualifiedTarget() + " (" +
                       columnList() + ") SELECT " + columnList() + " FROM " +
                       staging);
  return statements;
}
