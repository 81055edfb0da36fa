#include "sync/ExtractionPipeline.h"
#include "core/errors.h"
#include "core/logger.h"
#include "core/pipeline_config.h"
#include "sync/WatermarkResolver.h"

ExtractionStream::ExtractionStream(std::unique_ptr<IRowStream> rows,
                                   std::vector<std::string> header,
                                   int compressionLevel)
    : rows_(std::move(rows)),
      csv_(std::make_unique<CsvEncoder>(*rows_, std::move(header))),
      gzip_(std::make_unique<GzipStream>(*csv_, compressionLevel)) {}

size_t ExtractionStream::read(char *buffer, size_t size) {
  return gzip_->read(buffer, size);
}

SelectQuery
ExtractionPipeline::buildQuery(const Configuration &configuration,
                               const std::string &tenantId,
                               const std::optional<Timestamp> &watermark) {
  if (configuration.columns.empty()) {
    throw ConfigurationError("Configuration " +
                             std::to_string(configuration.id) +
                             " maps no columns");
  }
  Discriminators d = WatermarkResolver::discriminatorsFor(configuration.view);

  auto inner = std::make_shared<SelectQuery>();
  for (const auto &column : configuration.view.columns)
    inner->columns.push_back({column.name, ""});
  inner->table = configuration.view.tableName;

  SelectQuery outer;
  for (const auto &mapping : configuration.columns)
    outer.columns.push_back({mapping.nameInSource, mapping.nameInDestination});
  outer.subquery = inner;
  outer.subqueryAlias = "t";
  outer.where.push_back(
      {d.tenantColumn, CompareOp::EQUAL, SqlLiteral::ofText(tenantId)});
  if (watermark) {
    outer.where.push_back({d.lastModifiedColumn, CompareOp::GREATER_THAN,
                           SqlLiteral::ofTimestamp(*watermark)});
  }
  return outer;
}

std::vector<std::string>
ExtractionPipeline::header(const Configuration &configuration) {
  std::vector<std::string> names;
  for (const auto &mapping : configuration.columns)
    names.push_back(mapping.nameInDestination);
  return names;
}

std::unique_ptr<ExtractionStream>
ExtractionPipeline::open(IDatabaseConnection &connection,
                         const Configuration &configuration,
                         const std::string &tenantId,
                         const std::optional<Timestamp> &watermark) {
  auto dialect = SqlDialectFactory::create(connection.engine());
  std::string sql =
      dialect->render(buildQuery(configuration, tenantId, watermark));
  Logger::debug(LogCategory::TRANSFER, "ExtractionPipeline::open",
                "Extraction query: " + sql);

  auto rows = connection.queryStream(sql, PipelineConfig::getFetchBatchSize());
  return std::make_unique<ExtractionStream>(
      std::move(rows), header(configuration),
      PipelineConfig::getCompressionLevel());
}
