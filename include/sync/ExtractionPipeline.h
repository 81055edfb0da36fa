#ifndef EXTRACTION_PIPELINE_H
#define EXTRACTION_PIPELINE_H

#include "engines/database_connection.h"
#include "engines/sql_dialect.h"
#include "transformations/csv_encoder.h"
#include "transformations/gzip_stream.h"
#include <memory>
#include <optional>
#include <string>

// Owns the three stages of one extraction: source cursor, CSV encoder and
// gzip compressor. Reading from it pulls rows from the source on demand.
class ExtractionStream : public ByteSource {
  std::unique_ptr<IRowStream> rows_;
  std::unique_ptr<CsvEncoder> csv_;
  std::unique_ptr<GzipStream> gzip_;

public:
  ExtractionStream(std::unique_ptr<IRowStream> rows,
                   std::vector<std::string> header, int compressionLevel);

  size_t read(char *buffer, size_t size) override;

  size_t rowsEncoded() const { return csv_->rowsEncoded(); }
  size_t compressedBytes() const { return gzip_->bytesOut(); }
};

class ExtractionPipeline {
public:
  // SELECT <nameInSource> AS <nameInDestination>, ...
  // FROM (SELECT <view columns> FROM <table>) AS t
  // WHERE <tenant> = <tenantId> [AND <lastModified> > <watermark>]
  // The watermark filter is omitted only when the share has never synced.
  static SelectQuery buildQuery(const Configuration &configuration,
                                const std::string &tenantId,
                                const std::optional<Timestamp> &watermark);

  static std::vector<std::string> header(const Configuration &configuration);

  std::unique_ptr<ExtractionStream>
  open(IDatabaseConnection &connection, const Configuration &configuration,
       const std::string &tenantId, const std::optional<Timestamp> &watermark);
};

#endif
