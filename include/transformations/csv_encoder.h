#ifndef CSV_ENCODER_H
#define CSV_ENCODER_H

#include "engines/database_connection.h"
#include "transformations/byte_source.h"
#include <string>
#include <vector>

// Encodes a row stream as comma-separated text: optional UTF-8 BOM, one
// header line, then one line per row terminated by '\n'. Fields containing
// the delimiter, quotes or line breaks are quoted RFC 4180 style. NULL is
// an empty field and an empty string is "".
class CsvEncoder : public ByteSource {
  IRowStream &rows_;
  std::vector<std::string> header_;
  bool writeBom_;
  bool headerWritten_ = false;
  bool finished_ = false;
  std::string pending_;
  size_t pendingOffset_ = 0;
  size_t rowsEncoded_ = 0;
  SqlRow row_;

  bool refill();

public:
  CsvEncoder(IRowStream &rows, std::vector<std::string> header,
             bool writeBom = true);

  size_t read(char *buffer, size_t size) override;

  size_t rowsEncoded() const { return rowsEncoded_; }

  static std::string encodeField(const SqlValue &value);
  static std::string encodeLine(const SqlRow &row);
};

#endif
