#include "loaders/object_store_loader.h"
#include "core/logger.h"

namespace {
constexpr const char *EXTENSION = "gz";
}

ObjectStoreLoader::ObjectStoreLoader(std::shared_ptr<IObjectStorage> storage)
    : storage_(std::move(storage)) {}

void ObjectStoreLoader::stage(ByteSource &contents) {
  std::string key = storage_->upload(contents, EXTENSION);
  objectUrl_ = storage_->sign(key, EXTENSION);
  Logger::info(LogCategory::STORAGE, "ObjectStoreLoader::stage",
               "Published " + storage_->location(key));
}
