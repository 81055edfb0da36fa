#include "sync/TransferRunner.h"
#include "core/logger.h"
#include <algorithm>
#include <functional>

TransferRunner::TransferRunner(TransferOrchestrator &orchestrator,
                               WebhookNotifier *notifier, size_t numWorkers)
    : orchestrator_(orchestrator), notifier_(notifier),
      numWorkers_(std::max<size_t>(1, numWorkers)) {}

std::vector<TransferOutcome>
TransferRunner::run(const std::vector<int64_t> &transferIds) {
  std::vector<TransferOutcome> outcomes(transferIds.size());
  if (transferIds.empty())
    return outcomes;

  ThreadSafeQueue<TransferTask> tasks;
  for (size_t i = 0; i < transferIds.size(); ++i)
    tasks.push(TransferTask{i, transferIds[i]});
  tasks.finish();

  size_t workerCount = std::min(numWorkers_, transferIds.size());
  Logger::info(LogCategory::TRANSFER, "TransferRunner::run",
               "Processing " + std::to_string(transferIds.size()) +
                   " transfers with " + std::to_string(workerCount) +
                   " workers");

  std::vector<std::thread> workers;
  workers.reserve(workerCount);
  for (size_t i = 0; i < workerCount; ++i) {
    workers.emplace_back(&TransferRunner::workerThread, this, i,
                         std::ref(tasks), std::ref(outcomes));
  }
  for (auto &worker : workers) {
    if (worker.joinable())
      worker.join();
  }

  Logger::info(LogCategory::TRANSFER, "TransferRunner::run",
               "All transfers processed - Completed: " +
                   std::to_string(completedTasks_.load()) +
                   " | Not completed: " + std::to_string(failedTasks_.load()));
  return outcomes;
}

// Each worker writes only to the outcome slots of the tasks it popped.
void TransferRunner::workerThread(size_t workerId,
                                  ThreadSafeQueue<TransferTask> &tasks,
                                  std::vector<TransferOutcome> &outcomes) {
  TransferTask task;
  while (tasks.popBlocking(task)) {
    Logger::debug(LogCategory::TRANSFER, "TransferRunner::workerThread",
                  "Worker #" + std::to_string(workerId) +
                      " processing transfer " +
                      std::to_string(task.transferId));

    TransferOutcome outcome = orchestrator_.processTransfer(task.transferId);
    if (outcome.disposition == TransferDisposition::COMPLETE ||
        outcome.disposition == TransferDisposition::CANCELLED) {
      completedTasks_++;
    } else {
      failedTasks_++;
    }

    if (notifier_ && outcome.disposition != TransferDisposition::REJECTED) {
      size_t delivered = notifier_->notifyAll(task.transferId);
      Logger::debug(LogCategory::WEBHOOK, "TransferRunner::workerThread",
                    "Delivered " + std::to_string(delivered) +
                        " webhooks for transfer " +
                        std::to_string(task.transferId));
    }

    outcomes[task.index] = std::move(outcome);
  }
}
