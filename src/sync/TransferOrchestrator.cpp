#include "sync/TransferOrchestrator.h"
#include "core/errors.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <chrono>

std::string transferDispositionToString(TransferDisposition disposition) {
  switch (disposition) {
  case TransferDisposition::COMPLETE:
    return "COMPLETE";
  case TransferDisposition::FAILED:
    return "FAILED";
  case TransferDisposition::CANCELLED:
    return "CANCELLED";
  case TransferDisposition::REJECTED:
    return "REJECTED";
  }
  return "UNKNOWN";
}

TransferOrchestrator::TransferOrchestrator(ICatalogStore &catalog,
                                           IConnectionProvider &connections,
                                           ILoaderFactory &loaders)
    : catalog_(catalog), connections_(connections), loaders_(loaders) {}

TransferOutcome TransferOrchestrator::processTransfer(int64_t transferId) {
  TransferGraph graph;
  try {
    graph = claim(transferId);
  } catch (const TransferRejectedError &e) {
    Logger::warning(LogCategory::TRANSFER,
                    "TransferOrchestrator::processTransfer", e.what());
    return {transferId, TransferDisposition::REJECTED, std::nullopt, e.what()};
  } catch (const std::exception &e) {
    // Nothing has been written yet, so the transfer stays STARTED.
    Logger::error(LogCategory::TRANSFER,
                  "TransferOrchestrator::processTransfer",
                  "Could not claim transfer " + std::to_string(transferId) +
                      ": " + std::string(e.what()));
    return {transferId, TransferDisposition::REJECTED, std::nullopt, e.what()};
  }

  try {
    return execute(graph);
  } catch (const std::exception &e) {
    Logger::error(LogCategory::TRANSFER,
                  "TransferOrchestrator::processTransfer",
                  "Transfer " + std::to_string(transferId) +
                      " failed: " + std::string(e.what()));
    return fail(transferId, e.what());
  }
}

TransferGraph TransferOrchestrator::claim(int64_t transferId) {
  auto graph = catalog_.loadTransferGraph(transferId);
  if (!graph) {
    throw TransferRejectedError("Transfer with ID " +
                                std::to_string(transferId) +
                                " does not exist");
  }
  if (graph->transfer.status != TransferStatus::STARTED) {
    throw TransferRejectedError(
        "Transfer with ID " + std::to_string(transferId) +
        " has already been processed (" +
        transferStatusToString(graph->transfer.status) + ")");
  }
  if (!catalog_.claimTransfer(transferId)) {
    throw TransferRejectedError("Transfer with ID " +
                                std::to_string(transferId) +
                                " was claimed by another worker");
  }
  graph->transfer.status = TransferStatus::PENDING;
  return *graph;
}

TransferOutcome TransferOrchestrator::fail(int64_t transferId,
                                           const std::string &message) {
  try {
    catalog_.finalizeFailed(transferId);
  } catch (const std::exception &e) {
    // The transfer is left PENDING, which is visible to operators.
    Logger::critical(LogCategory::TRANSFER, "TransferOrchestrator::fail",
                     "Could not mark transfer " + std::to_string(transferId) +
                         " as FAILED: " + std::string(e.what()));
    return {transferId, TransferDisposition::FAILED, std::nullopt, message};
  }

  try {
    catalog_.appendLog({LogDomain::TRANSFER, LogAction::UPDATE, transferId,
                        "Transfer " + std::to_string(transferId) +
                            " failed: " + message});
  } catch (const std::exception &e) {
    Logger::error(LogCategory::TRANSFER, "TransferOrchestrator::fail",
                  "Could not write audit entry for transfer " +
                      std::to_string(transferId) + ": " +
                      std::string(e.what()));
  }
  return {transferId, TransferDisposition::FAILED, std::nullopt, message};
}

std::unique_ptr<IDatabaseConnection>
TransferOrchestrator::connectSource(const Source &source) {
  ConnectionRequest request;
  request.engine = source.engine;
  request.host = source.host;
  request.port = source.port;
  request.username = source.username;
  request.password = source.password;
  request.database = source.database;

  ConnectionResult result = connections_.connect(request);
  if (result.status != ConnectionStatus::REACHABLE || !result.connection) {
    throw ConnectivityError("Source with ID " + std::to_string(source.id) +
                            " is unreachable: " + result.message);
  }
  return std::move(result.connection);
}

TableTarget TransferOrchestrator::targetFor(const Configuration &configuration,
                                            const Destination &destination) {
  TableTarget target;
  target.schema = destination.schema.value_or("");
  target.table = StringUtils::unqualifiedName(configuration.view.tableName);
  for (const auto &mapping : configuration.columns) {
    target.columns.push_back(
        {mapping.nameInDestination, mapping.viewColumn.dataType});
    if (mapping.viewColumn.isPrimaryKey)
      target.keyColumns.push_back(mapping.nameInDestination);
  }
  return target;
}

void TransferOrchestrator::load(IDestinationLoader &loader,
                                const TableTarget &target,
                                ByteSource &contents) {
  try {
    loader.beginTransaction();
    loader.createTable(target);
    loader.stage(contents);
    loader.upsert();
    loader.tearDown();
    loader.commitTransaction();
  } catch (const std::exception &e) {
    if (loader.isTransactional()) {
      try {
        loader.rollbackTransaction();
      } catch (const std::exception &rollbackError) {
        Logger::error(LogCategory::TRANSFER, "TransferOrchestrator::load",
                      "Rollback failed: " + std::string(rollbackError.what()));
      }
    }
    throw;
  }
}

TransferOutcome TransferOrchestrator::execute(const TransferGraph &graph) {
  const int64_t transferId = graph.transfer.id;
  const Share &share = graph.share;
  auto startTime = std::chrono::steady_clock::now();

  if (!share.configuration) {
    throw ConfigurationError("No configuration found for transfer with ID " +
                             std::to_string(transferId) + ", aborting");
  }
  const Configuration &configuration = *share.configuration;
  const View &view = configuration.view;
  WatermarkResolver::discriminatorsFor(view);

  auto source = connectSource(view.source);

  std::optional<Timestamp> observed =
      watermarks_.resolve(*source, view, share.tenantId);
  if (!observed || (share.lastModifiedAt && *observed <= *share.lastModifiedAt)) {
    catalog_.markCancelled(transferId);
    Logger::info(LogCategory::TRANSFER, "TransferOrchestrator::execute",
                 "Transfer " + std::to_string(transferId) +
                     " cancelled: no rows newer than the current watermark");
    return {transferId, TransferDisposition::CANCELLED, std::nullopt,
            "No new data"};
  }

  auto extraction =
      pipeline_.open(*source, configuration, share.tenantId, share.lastModifiedAt);
  auto loader = loaders_.open(share.destination);
  load(*loader, targetFor(configuration, share.destination), *extraction);

  std::optional<std::string> objectUrl = loader->objectUrl();
  catalog_.finalizeComplete(transferId, share.id, objectUrl, *observed);

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - startTime)
                     .count();
  Logger::info(LogCategory::TRANSFER, "TransferOrchestrator::execute",
               "Transfer " + std::to_string(transferId) + " complete: " +
                   std::to_string(extraction->rowsEncoded()) + " rows, " +
                   std::to_string(extraction->compressedBytes()) +
                   " compressed bytes in " + std::to_string(elapsed) +
                   "ms, watermark " + TimeUtils::formatIso8601(*observed));
  return {transferId, TransferDisposition::COMPLETE, objectUrl, "Complete"};
}
