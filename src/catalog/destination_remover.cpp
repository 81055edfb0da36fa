#include "catalog/destination_remover.h"
#include "core/errors.h"
#include "core/logger.h"

void DestinationRemover::remove(int64_t destinationId) {
  DestinationDeleteResult result = catalog_.deleteDestinationIfIdle(destinationId);

  switch (result) {
  case DestinationDeleteResult::DELETED:
    Logger::info(LogCategory::CATALOG, "DestinationRemover::remove",
                 "Deleted destination " + std::to_string(destinationId));
    return;
  case DestinationDeleteResult::NOT_FOUND:
    throw NotFoundError("destination_id_not_found");
  case DestinationDeleteResult::TRANSFER_IN_PROGRESS:
    throw PreconditionFailedError(
        "transfer_in_progress",
        "You cannot delete destinations of ongoing transfers. You must "
        "explicitly cancel all transfers associated with this destination "
        "first.");
  }
}
