#ifndef TRANSFER_RUNNER_H
#define TRANSFER_RUNNER_H

#include "governance/WebhookNotifier.h"
#include "sync/ParallelProcessing.h"
#include "sync/TransferOrchestrator.h"
#include <atomic>
#include <thread>
#include <vector>

// Executes a batch of transfer ids on a fixed pool of workers. Each
// finalized transfer (anything but REJECTED) is followed by webhook
// delivery on the same worker.
class TransferRunner {
  struct TransferTask {
    size_t index = 0;
    int64_t transferId = 0;
  };

  TransferOrchestrator &orchestrator_;
  WebhookNotifier *notifier_;
  size_t numWorkers_;
  std::atomic<size_t> completedTasks_{0};
  std::atomic<size_t> failedTasks_{0};

  void workerThread(size_t workerId, ThreadSafeQueue<TransferTask> &tasks,
                    std::vector<TransferOutcome> &outcomes);

public:
  // notifier may be null to skip webhook delivery.
  TransferRunner(TransferOrchestrator &orchestrator, WebhookNotifier *notifier,
                 size_t numWorkers);

  TransferRunner(const TransferRunner &) = delete;
  TransferRunner &operator=(const TransferRunner &) = delete;

  // Outcomes are returned in the order of transferIds.
  std::vector<TransferOutcome> run(const std::vector<int64_t> &transferIds);

  size_t completedTasks() const { return completedTasks_.load(); }
  size_t failedTasks() const { return failedTasks_.load(); }
};

#endif
