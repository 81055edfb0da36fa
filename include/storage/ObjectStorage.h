#ifndef OBJECT_STORAGE_H
#define OBJECT_STORAGE_H

#include "transformations/byte_source.h"
#include <string>

// What a warehouse needs to read staged objects directly.
struct StorageCredentials {
  std::string accessKeyId;
  std::string secretAccessKey;
  std::string region;
};

class IObjectStorage {
public:
  virtual ~IObjectStorage() = default;

  // Streams contents to a new random key ending in ".<extension>" and
  // returns the key. Throws LoadError on failure; nothing is left behind.
  virtual std::string upload(ByteSource &contents,
                             const std::string &extension) = 0;

  // Time-limited GET URL for an uploaded key.
  virtual std::string sign(const std::string &key,
                           const std::string &extension) = 0;

  virtual void remove(const std::string &key) = 0;

  // s3://bucket/key
  virtual std::string location(const std::string &key) const = 0;

  virtual StorageCredentials credentials() const = 0;
};

#endif
