#ifndef DESTINATION_REMOVER_H
#define DESTINATION_REMOVER_H

#include "catalog/catalog_store.h"

// Deletes a destination unless a transfer on one of its shares is still
// STARTED or PENDING.
class DestinationRemover {
  ICatalogStore &catalog_;

public:
  explicit DestinationRemover(ICatalogStore &catalog) : catalog_(catalog) {}

  // Throws PreconditionFailedError ("transfer_in_progress") or
  // NotFoundError ("destination_id_not_found").
  void remove(int64_t destinationId);
};

#endif
