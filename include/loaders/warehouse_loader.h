#ifndef WAREHOUSE_LOADER_H
#define WAREHOUSE_LOADER_H

#include "engines/database_connection.h"
#include "loaders/destination_loader.h"
#include "storage/ObjectStorage.h"
#include <memory>

// Shared protocol for warehouses that bulk-load from object storage:
// the extract is uploaded to the staging bucket, COPYed into a temporary
// table shaped like the target and merged from there. The COPY and the merge
// always run inside one explicit transaction on the destination connection.
// Where DDL commits the open transaction, BEGIN is deferred until the
// target and staging tables exist and the staging table is dropped only
// after COMMIT or ROLLBACK.
class WarehouseLoader : public IDestinationLoader {
protected:
  std::unique_ptr<IDatabaseConnection> connection_;
  std::shared_ptr<IObjectStorage> staging_;
  std::optional<TableTarget> target_;
  std::optional<std::string> stagedKey_;
  std::string stagingTable_;
  bool stagingTableCreated_ = false;
  bool transactionRequested_ = false;
  bool transactionOpen_ = false;

  const TableTarget &target() const;
  std::string qualifiedTarget() const;
  std::string columnList(const std::string &prefix = "") const;
  std::vector<std::string> nonKeyColumns() const;
  void execute(const std::string &sql);
  void openTransaction();
  void dropStagingTable();
  void dropStagingTableAfterTransaction();

  virtual const char *name() const = 0;
  virtual std::string quoteIdentifier(const std::string &identifier) const = 0;
  virtual std::string quoteValue(const std::string &value) const;
  // Case folding the warehouse applies to unquoted identifiers.
  virtual std::string normalizeName(const std::string &name) const = 0;
  virtual std::string mapDataType(const std::string &dataType) const = 0;
  virtual std::string createStagingTableSql() const = 0;
  virtual std::string copySql(const std::string &objectLocation) const = 0;
  virtual std::vector<std::string> upsertSql() const = 0;
  virtual bool ddlCommitsTransaction() const { return false; }

public:
  WarehouseLoader(std::unique_ptr<IDatabaseConnection> connection,
                  std::shared_ptr<IObjectStorage> staging);

  bool isTransactional() const override { return true; }

  void beginTransaction() override;
  void createTable(const TableTarget &target) override;
  void stage(ByteSource &contents) override;
  void upsert() override;
  void tearDown() override;
  void commitTransaction() override;
  void rollbackTransaction() override;

  std::optional<std::string> objectUrl() const override { return std::nullopt; }

  const std::string &stagingTable() const { return stagingTable_; }
};

class SnowflakeLoader : public WarehouseLoader {
protected:
  const char *name() const override { return "SnowflakeLoader"; }
  std::string quoteIdentifier(const std::string &identifier) const override;
  std::string normalizeName(const std::string &name) const override;
  std::string mapDataType(const std::string &dataType) const override;
  std::string createStagingTableSql() const override;
  std::string copySql(const std::string &objectLocation) const override;
  std::vector<std::string> upsertSql() const override;
  bool ddlCommitsTransaction() const override { return true; }

public:
  using WarehouseLoader::WarehouseLoader;
};

class RedshiftLoader : public WarehouseLoader {
protected:
  const char *name() const override { return "RedshiftLoader"; }
  std::string quoteIdentifier(const std::string &identifier) const override;
  std::string normalizeName(const std::string &name) const override;
  std::string mapDataType(const std::string &dataType) const override;
  std::string createStagingTableSql() const override;
  std::string copySql(const std::string &objectLocation) const override;
  std::vector<std::string> upsertSql() const override;

public:
  using WarehouseLoader::WarehouseLoader;
};

#endif
