#ifndef OBJECT_STORE_LOADER_H
#define OBJECT_STORE_LOADER_H

#include "loaders/destination_loader.h"
#include "storage/ObjectStorage.h"
#include <memory>

// Uploads the compressed extract as "<uuid>.gz" and exposes a presigned GET
// URL. Not transactional: every step other than stage does nothing.
class ObjectStoreLoader : public IDestinationLoader {
  std::shared_ptr<IObjectStorage> storage_;
  std::optional<std::string> objectUrl_;

public:
  explicit ObjectStoreLoader(std::shared_ptr<IObjectStorage> storage);

  bool isTransactional() const override { return false; }

  void beginTransaction() override {}
  void createTable(const TableTarget &) override {}
  void stage(ByteSource &contents) override;
  void upsert() override {}
  void tearDown() override {}
  void commitTransaction() override {}
  void rollbackTransaction() override {}

  std::optional<std::string> objectUrl() const override { return objectUrl_; }
};

#endif
