#include "transformations/csv_encoder.h"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace {
constexpr const char *UTF8_BOM = "\xEF\xBB\xBF";
constexpr char DELIMITER = ',';
} // namespace

CsvEncoder::CsvEncoder(IRowStream &rows, std::vector<std::string> header,
                       bool writeBom)
    : rows_(rows), header_(std::move(header)), writeBom_(writeBom) {}

std::string CsvEncoder::encodeField(const SqlValue &value) {
  if (!value)
    return "";
  const std::string &text = *value;
  if (text.empty())
    return "\"\"";

  bool needsQuotes = text.find_first_of(",\"\r\n") != std::string::npos;
  if (!needsQuotes)
    return text;

  std::string quoted = "\"";
  for (char c : text) {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

std::string CsvEncoder::encodeLine(const SqlRow &row) {
  std::string line;
  for (size_t i = 0; i < row.size(); ++i) {
    if (i > 0)
      line += DELIMITER;
    line += encodeField(row[i]);
  }
  line += '\n';
  return line;
}

// Produces the next chunk of text: the header first, then exactly one row
// per call. Returns false once the row stream is exhausted.
bool CsvEncoder::refill() {
  pending_.clear();
  pendingOffset_ = 0;

  if (!headerWritten_) {
    headerWritten_ = true;
    if (writeBom_)
      pending_ = UTF8_BOM;
    SqlRow headerRow(header_.begin(), header_.end());
    pending_ += encodeLine(headerRow);
    return true;
  }

  if (finished_)
    return false;

  if (!rows_.next(row_)) {
    finished_ = true;
    return false;
  }
  if (row_.size() != header_.size()) {
    throw std::runtime_error("Row has " + std::to_string(row_.size()) +
                             " fields but the header has " +
                             std::to_string(header_.size()));
  }
  pending_ = encodeLine(row_);
  ++rowsEncoded_;
  return true;
}

size_t CsvEncoder::read(char *buffer, size_t size) {
  size_t written = 0;
  while (written < size) {
    if (pendingOffset_ >= pending_.size() && !refill())
      break;
    size_t chunk = std::min(size - written, pending_.size() - pendingOffset_);
    std::memcpy(buffer + written, pending_.data() + pendingOffset_, chunk);
    pendingOffset_ += chunk;
    written += chunk;
  }
  return written;
}
