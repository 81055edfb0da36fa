#ifndef LOADER_FACTORY_H
#define LOADER_FACTORY_H

#include "engines/connection_provider.h"
#include "loaders/destination_loader.h"
#include "storage/ObjectStorage.h"
#include <memory>

class ILoaderFactory {
public:
  virtual ~ILoaderFactory() = default;

  // Returns a ready loader or throws. Nothing is returned, and therefore
  // nothing needs rolling back, when this throws.
  virtual std::unique_ptr<IDestinationLoader>
  open(const Destination &destination) = 0;
};

class DefaultLoaderFactory : public ILoaderFactory {
  IConnectionProvider &connections_;
  std::shared_ptr<IObjectStorage> exportStorage_;
  std::shared_ptr<IObjectStorage> stagingStorage_;

public:
  DefaultLoaderFactory(IConnectionProvider &connections,
                       std::shared_ptr<IObjectStorage> exportStorage,
                       std::shared_ptr<IObjectStorage> stagingStorage);

  std::unique_ptr<IDestinationLoader>
  open(const Destination &destination) override;

  // Host, port, username, password, database and schema must all be set.
  // Throws ConfigurationError naming the missing fields.
  static void validateWarehouseCredentials(const Destination &destination);
};

#endif
