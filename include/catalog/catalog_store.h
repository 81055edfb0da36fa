#ifndef CATALOG_STORE_H
#define CATALOG_STORE_H

#include "catalog/catalog_models.h"
#include <optional>
#include <vector>

enum class DestinationDeleteResult { DELETED, NOT_FOUND, TRANSFER_IN_PROGRESS };

// Persistence contract for transfers, shares and their satellites. Every
// method is durable on return and visible to concurrent readers.
class ICatalogStore {
public:
  virtual ~ICatalogStore() = default;

  virtual std::optional<TransferGraph> loadTransferGraph(int64_t transferId) = 0;

  // STARTED -> PENDING as one conditional update. False when the transfer
  // is missing or was no longer STARTED.
  virtual bool claimTransfer(int64_t transferId) = 0;

  virtual void markCancelled(int64_t transferId) = 0;

  // FAILED plus a TransferResult carrying only finalizedAt.
  virtual void finalizeFailed(int64_t transferId) = 0;

  // COMPLETE, TransferResult upsert and watermark advance in one
  // transaction. The watermark never moves backwards.
  virtual void finalizeComplete(int64_t transferId, int64_t shareId,
                                const std::optional<std::string> &objectUrl,
                                Timestamp newWatermark) = 0;

  virtual std::optional<TransferSnapshot>
  loadTransferSnapshot(int64_t transferId) = 0;

  virtual std::vector<Webhook> listWebhooks() = 0;

  virtual DestinationDeleteResult
  deleteDestinationIfIdle(int64_t destinationId) = 0;

  virtual void appendLog(const LogEntry &entry) = 0;
};

#endif
