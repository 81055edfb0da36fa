#ifndef TRANSFER_ORCHESTRATOR_H
#define TRANSFER_ORCHESTRATOR_H

#include "catalog/catalog_store.h"
#include "engines/connection_provider.h"
#include "loaders/loader_factory.h"
#include "sync/ExtractionPipeline.h"
#include "sync/WatermarkResolver.h"
#include <optional>
#include <string>

enum class TransferDisposition { COMPLETE, FAILED, CANCELLED, REJECTED };

std::string transferDispositionToString(TransferDisposition disposition);

struct TransferOutcome {
  int64_t transferId = 0;
  TransferDisposition disposition = TransferDisposition::REJECTED;
  std::optional<std::string> objectUrl;
  std::string message;
};

// Runs one transfer through STARTED -> PENDING -> COMPLETE | FAILED |
// CANCELLED. A transfer that cannot be claimed is REJECTED and nothing is
// written for it.
class TransferOrchestrator {
  ICatalogStore &catalog_;
  IConnectionProvider &connections_;
  ILoaderFactory &loaders_;
  WatermarkResolver watermarks_;
  ExtractionPipeline pipeline_;

  TransferGraph claim(int64_t transferId);
  TransferOutcome execute(const TransferGraph &graph);
  std::unique_ptr<IDatabaseConnection> connectSource(const Source &source);
  void load(IDestinationLoader &loader, const TableTarget &target,
            ByteSource &contents);
  TransferOutcome fail(int64_t transferId, const std::string &message);

public:
  TransferOrchestrator(ICatalogStore &catalog, IConnectionProvider &connections,
                       ILoaderFactory &loaders);

  // Never throws; every failure after the claim ends in FAILED.
  TransferOutcome processTransfer(int64_t transferId);

  static TableTarget targetFor(const Configuration &configuration,
                               const Destination &destination);
};

#endif
