#ifndef DESTINATION_LOADER_H
#define DESTINATION_LOADER_H

#include "transformations/byte_source.h"
#include <optional>
#include <string>
#include <vector>

struct TargetColumn {
  std::string name;
  std::string dataType;
};

struct TableTarget {
  std::string schema;
  std::string table;
  std::vector<TargetColumn> columns;
  std::vector<std::string> keyColumns;
};

// Uniform load protocol driven by the orchestrator:
// begin, createTable, stage, upsert, tearDown, commit. On failure the caller
// invokes rollbackTransaction on transactional loaders; loaders never roll
// themselves back.
class IDestinationLoader {
public:
  virtual ~IDestinationLoader() = default;

  virtual bool isTransactional() const = 0;

  virtual void beginTransaction() = 0;
  virtual void createTable(const TableTarget &target) = 0;
  virtual void stage(ByteSource &contents) = 0;
  virtual void upsert() = 0;
  virtual void tearDown() = 0;
  virtual void commitTransaction() = 0;
  virtual void rollbackTransaction() = 0;

  // Set once stage succeeded on loaders that produce a retrievable object.
  virtual std::optional<std::string> objectUrl() const = 0;
};

#endif
