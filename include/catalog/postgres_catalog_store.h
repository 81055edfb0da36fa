#ifndef POSTGRES_CATALOG_STORE_H
#define POSTGRES_CATALOG_STORE_H

#include "catalog/catalog_store.h"
#include <pqxx/pqxx>
#include <string>

// ICatalogStore backed by the sharesync schema (sql/catalog_schema.sql).
// Opens a fresh connection per call so it can be shared across workers.
class PostgresCatalogStore : public ICatalogStore {
  std::string connectionString_;

  pqxx::connection getConnection();
  void insertAuditLog(pqxx::work &txn, const LogEntry &entry);
  std::optional<Configuration> loadConfiguration(pqxx::work &txn,
                                                 int64_t configurationId);

public:
  explicit PostgresCatalogStore(std::string connectionString);

  std::optional<TransferGraph> loadTransferGraph(int64_t transferId) override;
  bool claimTransfer(int64_t transferId) override;
  void markCancelled(int64_t transferId) override;
  void finalizeFailed(int64_t transferId) override;
  void finalizeComplete(int64_t transferId, int64_t shareId,
                        const std::optional<std::string> &objectUrl,
                        Timestamp newWatermark) override;
  std::optional<TransferSnapshot>
  loadTransferSnapshot(int64_t transferId) override;
  std::vector<Webhook> listWebhooks() override;
  DestinationDeleteResult deleteDestinationIfIdle(int64_t destinationId) override;
  void appendLog(const LogEntry &entry) override;
};

#endif
