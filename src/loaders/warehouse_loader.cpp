#include "loaders/warehouse_loader.h"
#include "core/errors.h"
#include "core/logger.h"
#include "utils/string_utils.h"

namespace {
constexpr const char *STAGING_EXTENSION = "gz";
constexpr const char *STAGING_TABLE_PREFIX = "sharesync_stage_";
} // namespace

WarehouseLoader::WarehouseLoader(
    std::unique_ptr<IDatabaseConnection> connection,
    std::shared_ptr<IObjectStorage> staging)
    : connection_(std::move(connection)), staging_(std::move(staging)) {
  std::string suffix = StringUtils::replaceAll(StringUtils::randomUuid(), "-", "");
  stagingTable_ = STAGING_TABLE_PREFIX + suffix.substr(0, 12);
}

const TableTarget &WarehouseLoader::target() const {
  if (!target_) {
    throw LoadError("createTable must run before staging");
  }
  return *target_;
}

std::string WarehouseLoader::quoteValue(const std::string &value) const {
  return "'" + StringUtils::replaceAll(value, "'", "''") + "'";
}

std::string WarehouseLoader::qualifiedTarget() const {
  const TableTarget &t = target();
  return quoteIdentifier(t.schema) + "." + quoteIdentifier(t.table);
}

std::string WarehouseLoader::columnList(const std::string &prefix) const {
  std::string list;
  for (const auto &column : target().columns) {
    if (!list.empty())
      list += ", ";
    list += prefix + quoteIdentifier(column.name);
  }
  return list;
}

std::vector<std::string> WarehouseLoader::nonKeyColumns() const {
  const TableTarget &t = target();
  std::vector<std::string> columns;
  for (const auto &column : t.columns) {
    bool isKey = false;
    for (const auto &key : t.keyColumns) {
      if (key == column.name) {
        isKey = true;
        break;
      }
    }
    if (!isKey)
      columns.push_back(column.name);
  }
  return columns;
}

void WarehouseLoader::execute(const std::string &sql) {
  Logger::debug(LogCategory::WAREHOUSE, name(), sql);
  connection_->queryUnsafe(sql);
}

void WarehouseLoader::openTransaction() {
  execute("BEGIN");
  transactionOpen_ = true;
}

void WarehouseLoader::beginTransaction() {
  transactionRequested_ = true;
  if (!ddlCommitsTransaction())
    openTransaction();
}

void WarehouseLoader::dropStagingTable() {
  execute("DROP TABLE IF EXISTS " + quoteIdentifier(stagingTable_));
  stagingTableCreated_ = false;
}

// The transaction is already settled here, so a failed drop is only logged.
// The temporary table disappears with the session anyway.
void WarehouseLoader::dropStagingTableAfterTransaction() {
  if (!ddlCommitsTransaction() || !stagingTableCreated_)
    return;
  try {
    dropStagingTable();
  } catch (const std::exception &e) {
    Logger::warning(LogCategory::WAREHOUSE, name(),
                    "Could not drop staging table " + stagingTable_ + ": " +
                        std::string(e.what()));
  }
}

void WarehouseLoader::createTable(const TableTarget &target) {
  if (target.schema.empty() || target.table.empty() || target.columns.empty()) {
    throw ConfigurationError(std::string(name()) +
                             ": target needs a schema, a table and columns");
  }

  TableTarget normalized;
  normalized.schema = normalizeName(target.schema);
  normalized.table = normalizeName(target.table);
  for (const auto &column : target.columns)
    normalized.columns.push_back(
        {normalizeName(column.name), mapDataType(column.dataType)});
  for (const auto &key : target.keyColumns)
    normalized.keyColumns.push_back(normalizeName(key));
  target_ = normalized;

  std::string sql = "CREATE TABLE IF NOT EXISTS " + qualifiedTarget() + " (";
  for (size_t i = 0; i < normalized.columns.size(); ++i) {
    if (i > 0)
      sql += ", ";
    sql += quoteIdentifier(normalized.columns[i].name) + " " +
           normalized.columns[i].dataType;
  }
  sql += ")";

  try {
    execute(sql);
  } catch (const std::exception &e) {
    Logger::error(LogCategory::WAREHOUSE, name(),
                  "Error creating table " + qualifiedTarget() + ": " +
                      std::string(e.what()));
    throw LoadError("createTable failed: " + std::string(e.what()));
  }
}

void WarehouseLoader::stage(ByteSource &contents) {
  try {
    stagedKey_ = staging_->upload(contents, STAGING_EXTENSION);
    execute(createStagingTableSql());
    stagingTableCreated_ = true;
    if (transactionRequested_ && !transactionOpen_)
      openTransaction();
    execute(copySql(staging_->location(*stagedKey_)));
  } catch (const std::exception &e) {
    Logger::error(LogCategory::WAREHOUSE, name(),
                  "Error staging into " + stagingTable_ + ": " +
                      std::string(e.what()));
    throw LoadError("stage failed: " + std::string(e.what()));
  }
}

void WarehouseLoader::upsert() {
  try {
    if (transactionRequested_ && !transactionOpen_)
      openTransaction();
    for (const auto &sql : upsertSql())
      execute(sql);
  } catch (const std::exception &e) {
    Logger::error(LogCategory::WAREHOUSE, name(),
                  "Error merging into " + qualifiedTarget() + ": " +
                      std::string(e.what()));
    throw LoadError("upsert failed: " + std::string(e.what()));
  }
}

void WarehouseLoader::tearDown() {
  try {
    if (stagingTableCreated_ && !ddlCommitsTransaction())
      dropStagingTable();
    if (stagedKey_) {
      staging_->remove(*stagedKey_);
      stagedKey_.reset();
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::WAREHOUSE, name(),
                  "Error tearing down " + stagingTable_ + ": " +
                      std::string(e.what()));
    throw LoadError("tearDown failed: " + std::string(e.what()));
  }
}

void WarehouseLoader::commitTransaction() {
  execute("COMMIT");
  transactionOpen_ = false;
  dropStagingTableAfterTransaction();
}

// Temporary tables vanish with the session; the staged object does not, so
// it is removed first on a best-effort basis.
void WarehouseLoader::rollbackTransaction() {
  if (stagedKey_) {
    try {
      staging_->remove(*stagedKey_);
      stagedKey_.reset();
    } catch (const std::exception &e) {
      Logger::warning(LogCategory::WAREHOUSE, name(),
                      "Could not remove staged object " +
                          staging_->location(*stagedKey_) + ": " +
                          std::string(e.what()));
    }
  }
  if (transactionOpen_) {
    execute("ROLLBACK");
    transactionOpen_ = false;
  }
  dropStagingTableAfterTransaction();
}
