#include "catalog/postgres_catalog_store.h"
#include "core/logger.h"
#include <unordered_map>

namespace {

// Timestamps cross the wire as text in a fixed UTC format so that the
// microsecond part survives regardless of the session time zone.
constexpr const char *UTC_TEXT_FORMAT = "'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"'";

std::string utcText(const std::string &column) {
  return "to_char(" + column + " AT TIME ZONE 'UTC', " + UTC_TEXT_FORMAT + ")";
}

std::optional<std::string> optionalText(const pqxx::field &field) {
  if (field.is_null())
    return std::nullopt;
  return field.as<std::string>();
}

std::optional<Timestamp> optionalTimestamp(const pqxx::field &field) {
  if (field.is_null())
    return std::nullopt;
  std::string text = field.as<std::string>();
  auto parsed = TimeUtils::parseIso8601(text);
  if (!parsed) {
    throw std::runtime_error("Catalog returned an unparseable timestamp: " +
                             text);
  }
  return parsed;
}

} // namespace

PostgresCatalogStore::PostgresCatalogStore(std::string connectionString)
    : connectionString_(std::move(connectionString)) {}

pqxx::connection PostgresCatalogStore::getConnection() {
  return pqxx::connection(connectionString_);
}

void PostgresCatalogStore::insertAuditLog(pqxx::work &txn,
                                          const LogEntry &entry) {
  txn.exec_params("INSERT INTO sharesync.audit_log "
                  "(domain, action, domain_id, message) "
                  "VALUES ($1, $2, $3, $4)",
                  logDomainToString(entry.domain),
                  logActionToString(entry.action), entry.domainId,
                  entry.message);
}

std::optional<TransferGraph>
PostgresCatalogStore::loadTransferGraph(int64_t transferId) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);

    auto rows = txn.exec_params(
        "SELECT t.id, t.status, s.id, s.tenant_id, s.configuration_id, " +
            utcText("s.last_modified_at") +
            ", d.id, d.nickname, d.destination_type, d.host, d.port, "
            "d.username, d.password, d.database, d.schema, d.warehouse "
            "FROM sharesync.transfers t "
            "JOIN sharesync.shares s ON s.id = t.share_id "
            "JOIN sharesync.destinations d ON d.id = s.destination_id "
            "WHERE t.id = $1",
        transferId);

    if (rows.empty()) {
      txn.commit();
      return std::nullopt;
    }

    const auto &row = rows[0];
    TransferGraph graph;
    graph.transfer.id = row[0].as<int64_t>();
    graph.transfer.status = stringToTransferStatus(row[1].as<std::string>());
    graph.transfer.shareId = row[2].as<int64_t>();

    Share &share = graph.share;
    share.id = row[2].as<int64_t>();
    share.tenantId = row[3].as<std::string>();
    share.lastModifiedAt = optionalTimestamp(row[5]);

    Destination &dest = share.destination;
    dest.id = row[6].as<int64_t>();
    dest.nickname = row[7].as<std::string>();
    dest.destinationType = stringToDestinationType(row[8].as<std::string>());
    dest.host = optionalText(row[9]);
    if (!row[10].is_null())
      dest.port = row[10].as<int>();
    dest.username = optionalText(row[11]);
    dest.password = optionalText(row[12]);
    dest.database = optionalText(row[13]);
    dest.schema = optionalText(row[14]);
    dest.warehouse = optionalText(row[15]);

    if (!row[4].is_null()) {
      share.configuration = loadConfiguration(txn, row[4].as<int64_t>());
    }

    txn.commit();
    return graph;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CATALOG, "PostgresCatalogStore::loadTransferGraph",
                  "Error loading transfer " + std::to_string(transferId) +
                      ": " + std::string(e.what()));
    throw;
  }
}

std::optional<Configuration>
PostgresCatalogStore::loadConfiguration(pqxx::work &txn,
                                        int64_t configurationId) {
  auto configRows = txn.exec_params(
      "SELECT c.id, v.id, v.table_name, src.id, src.host, src.port, "
      "src.username, src.password, src.database, src.engine "
      "FROM sharesync.configurations c "
      "JOIN sharesync.views v ON v.id = c.view_id "
      "JOIN sharesync.sources src ON src.id = v.source_id "
      "WHERE c.id = $1",
      configurationId);
  if (configRows.empty())
    return std::nullopt;

  const auto &row = configRows[0];
  Configuration config;
  config.id = row[0].as<int64_t>();
  config.view.id = row[1].as<int64_t>();
  config.view.tableName = row[2].as<std::string>();

  Source &source = config.view.source;
  source.id = row[3].as<int64_t>();
  source.host = row[4].as<std::string>();
  source.port = row[5].as<int>();
  source.username = row[6].as<std::string>();
  source.password = row[7].as<std::string>();
  source.database = row[8].as<std::string>();
  source.engine = stringToDbEngine(row[9].as<std::string>());

  std::unordered_map<int64_t, ViewColumn> columnsById;
  auto columnRows = txn.exec_params(
      "SELECT id, name, data_type, is_last_modified, is_tenant_column, "
      "is_primary_key FROM sharesync.view_columns "
      "WHERE view_id = $1 ORDER BY ordinal, id",
      config.view.id);
  for (const auto &colRow : columnRows) {
    ViewColumn column;
    column.id = colRow[0].as<int64_t>();
    column.name = colRow[1].as<std::string>();
    column.dataType = colRow[2].is_null() ? "" : colRow[2].as<std::string>();
    column.isLastModified = colRow[3].as<bool>();
    column.isTenantColumn = colRow[4].as<bool>();
    column.isPrimaryKey = colRow[5].as<bool>();
    config.view.columns.push_back(column);
    columnsById[column.id] = column;
  }

  auto mappingRows = txn.exec_params(
      "SELECT view_column_id, name_in_source, name_in_destination "
      "FROM sharesync.configuration_columns "
      "WHERE configuration_id = $1 ORDER BY ordinal, id",
      config.id);
  for (const auto &mapRow : mappingRows) {
    ConfigurationColumn mapping;
    auto it = columnsById.find(mapRow[0].as<int64_t>());
    if (it != columnsById.end())
      mapping.viewColumn = it->second;
    mapping.nameInSource = mapRow[1].as<std::string>();
    mapping.nameInDestination = mapRow[2].as<std::string>();
    config.columns.push_back(mapping);
  }

  return config;
}

bool PostgresCatalogStore::claimTransfer(int64_t transferId) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto result = txn.exec_params(
        "UPDATE sharesync.transfers SET status = 'PENDING' "
        "WHERE id = $1 AND status = 'STARTED'",
        transferId);
    txn.commit();
    return result.affected_rows() == 1;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CATALOG, "PostgresCatalogStore::claimTransfer",
                  "Error claiming transfer " + std::to_string(transferId) +
                      ": " + std::string(e.what()));
    throw;
  }
}

void PostgresCatalogStore::markCancelled(int64_t transferId) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec_params(
        "UPDATE sharesync.transfers SET status = 'CANCELLED' WHERE id = $1",
        transferId);
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CATALOG, "PostgresCatalogStore::markCancelled",
                  "Error cancelling transfer " + std::to_string(transferId) +
                      ": " + std::string(e.what()));
    throw;
  }
}

void PostgresCatalogStore::finalizeFailed(int64_t transferId) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec_params(
        "UPDATE sharesync.transfers SET status = 'FAILED' WHERE id = $1",
        transferId);
    txn.exec_params(
        "INSERT INTO sharesync.transfer_results (transfer_id, finalized_at) "
        "VALUES ($1, NOW()) "
        "ON CONFLICT (transfer_id) DO UPDATE SET "
        "finalized_at = EXCLUDED.finalized_at, object_url = NULL",
        transferId);
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CATALOG, "PostgresCatalogStore::finalizeFailed",
                  "Error finalizing failed transfer " +
                      std::to_string(transferId) + ": " +
                      std::string(e.what()));
    throw;
  }
}

void PostgresCatalogStore::finalizeComplete(
    int64_t transferId, int64_t shareId,
    const std::optional<std::string> &objectUrl, Timestamp newWatermark) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    txn.exec_params(
        "UPDATE sharesync.transfers SET status = 'COMPLETE' WHERE id = $1",
        transferId);
    txn.exec_params(
        "INSERT INTO sharesync.transfer_results "
        "(transfer_id, finalized_at, object_url) VALUES ($1, NOW(), $2) "
        "ON CONFLICT (transfer_id) DO UPDATE SET "
        "finalized_at = EXCLUDED.finalized_at, "
        "object_url = EXCLUDED.object_url",
        transferId, objectUrl);
    // GREATEST ignores NULL, so the first sync simply sets the value.
    txn.exec_params("UPDATE sharesync.shares SET last_modified_at = "
                    "GREATEST(last_modified_at, $2::timestamptz) WHERE id = $1",
                    shareId, TimeUtils::formatIso8601(newWatermark));
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CATALOG,
                  "PostgresCatalogStore::finalizeComplete",
                  "Error finalizing transfer " + std::to_string(transferId) +
                      ": " + std::string(e.what()));
    throw;
  }
}

std::optional<TransferSnapshot>
PostgresCatalogStore::loadTransferSnapshot(int64_t transferId) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto rows = txn.exec_params(
        "SELECT t.id, t.status, t.share_id, r.transfer_id, " +
            utcText("r.finalized_at") +
            ", r.object_url "
            "FROM sharesync.transfers t "
            "LEFT JOIN sharesync.transfer_results r ON r.transfer_id = t.id "
            "WHERE t.id = $1",
        transferId);
    txn.commit();

    if (rows.empty())
      return std::nullopt;

    const auto &row = rows[0];
    TransferSnapshot snapshot;
    snapshot.transfer.id = row[0].as<int64_t>();
    snapshot.transfer.status = stringToTransferStatus(row[1].as<std::string>());
    snapshot.transfer.shareId = row[2].as<int64_t>();
    if (!row[3].is_null()) {
      TransferResult result;
      result.transferId = row[3].as<int64_t>();
      result.finalizedAt = *optionalTimestamp(row[4]);
      result.objectUrl = optionalText(row[5]);
      snapshot.result = result;
    }
    return snapshot;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CATALOG,
                  "PostgresCatalogStore::loadTransferSnapshot",
                  "Error loading transfer " + std::to_string(transferId) +
                      ": " + std::string(e.what()));
    throw;
  }
}

std::vector<Webhook> PostgresCatalogStore::listWebhooks() {
  std::vector<Webhook> webhooks;
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    auto rows = txn.exec("SELECT id, url, secret_key FROM sharesync.webhooks "
                         "ORDER BY id");
    txn.commit();

    for (const auto &row : rows) {
      Webhook webhook;
      webhook.id = row[0].as<int64_t>();
      webhook.url = row[1].as<std::string>();
      webhook.secretKey = row[2].as<std::string>();
      webhooks.push_back(webhook);
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CATALOG, "PostgresCatalogStore::listWebhooks",
                  "Error listing webhooks: " + std::string(e.what()));
    throw;
  }
  return webhooks;
}

DestinationDeleteResult
PostgresCatalogStore::deleteDestinationIfIdle(int64_t destinationId) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);

    // Lock the row so no share can be attached or transfer started against
    // it between the check and the delete.
    auto existing = txn.exec_params(
        "SELECT id FROM sharesync.destinations WHERE id = $1 FOR UPDATE",
        destinationId);
    if (existing.empty()) {
      txn.commit();
      return DestinationDeleteResult::NOT_FOUND;
    }

    auto pending = txn.exec_params(
        "SELECT COUNT(*) FROM sharesync.transfers t "
        "JOIN sharesync.shares s ON s.id = t.share_id "
        "WHERE s.destination_id = $1 AND t.status IN ('STARTED', 'PENDING')",
        destinationId);

    if (pending[0][0].as<int64_t>() > 0) {
      std::string message = "Attempted to delete destination " +
                            std::to_string(destinationId) +
                            " where transfer is pending.";
      Logger::warning(LogCategory::CATALOG,
                      "PostgresCatalogStore::deleteDestinationIfIdle", message);
      insertAuditLog(txn, LogEntry{LogDomain::CONFIGURATION, LogAction::DELETE,
                                   destinationId, message});
      txn.commit();
      return DestinationDeleteResult::TRANSFER_IN_PROGRESS;
    }

    txn.exec_params("DELETE FROM sharesync.destinations WHERE id = $1",
                    destinationId);
    insertAuditLog(txn, LogEntry{LogDomain::DESTINATION, LogAction::DELETE,
                                 destinationId,
                                 "Deleted destination " +
                                     std::to_string(destinationId) +
                                     " because it had no pending transfers."});
    txn.commit();
    return DestinationDeleteResult::DELETED;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CATALOG,
                  "PostgresCatalogStore::deleteDestinationIfIdle",
                  "Error deleting destination " +
                      std::to_string(destinationId) + ": " +
                      std::string(e.what()));
    throw;
  }
}

void PostgresCatalogStore::appendLog(const LogEntry &entry) {
  try {
    auto conn = getConnection();
    pqxx::work txn(conn);
    insertAuditLog(txn, entry);
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::CATALOG, "PostgresCatalogStore::appendLog",
                  "Error appending audit log: " + std::string(e.what()));
    throw;
  }
}
