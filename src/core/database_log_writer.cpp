#include "core/database_log_writer.h"
#include <algorithm>
#include <iostream>

namespace {
constexpr size_t MAX_FUNCTION_LENGTH = 255;
constexpr size_t MAX_MESSAGE_LENGTH = 10000;

// Number of bytes in the UTF-8 sequence introduced by lead byte c, or 0 when
// c cannot start a sequence.
size_t utf8SequenceLength(unsigned char c) {
  if (c < 0x80)
    return 1;
  if ((c & 0xE0) == 0xC0)
    return 2;
  if ((c & 0xF0) == 0xE0)
    return 3;
  if ((c & 0xF8) == 0xF0)
    return 4;
  return 0;
}

// Copies at most maxLength bytes of input, replacing malformed UTF-8 and
// control characters other than tab and newline with '?'. PostgreSQL rejects
// text columns with invalid encodings, which would otherwise lose the entry.
std::string sanitizeForText(const std::string &input, size_t maxLength) {
  std::string result;
  result.reserve(std::min(input.size(), maxLength));

  size_t i = 0;
  while (i < input.size() && result.size() < maxLength) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    size_t len = utf8SequenceLength(c);

    bool valid = len > 0 && i + len <= input.size();
    for (size_t k = 1; valid && k < len; ++k) {
      valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
    }

    if (!valid) {
      result += '?';
      ++i;
      continue;
    }
    if (len == 1 && c < 0x20 && c != '\t' && c != '\n') {
      result += '?';
      ++i;
      continue;
    }
    if (result.size() + len > maxLength)
      break;
    result.append(input, i, len);
    i += len;
  }
  return result;
}
} // namespace

DatabaseLogWriter::DatabaseLogWriter(const std::string &connectionString) {
  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString);
    prepareInsert();
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: catalog unreachable, database logging "
                 "disabled: "
              << e.what() << std::endl;
  }
}

void DatabaseLogWriter::prepareInsert() {
  if (!conn_ || !conn_->is_open() || statementPrepared_)
    return;

  try {
    conn_->prepare("sharesync_log_insert",
                   "INSERT INTO sharesync.logs (ts, level, category, "
                   "function, message) VALUES (NOW(), $1, $2, $3, $4)");
    statementPrepared_ = true;
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: cannot prepare log insert: " << e.what()
              << std::endl;
  }
}

// Oversized function names and messages are truncated, not dropped.
bool DatabaseLogWriter::write(const LogRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!enabled_ || !conn_ || !conn_->is_open() || !statementPrepared_)
    return false;

  try {
    pqxx::work txn(*conn_);
    txn.exec_prepared("sharesync_log_insert", record.level, record.category,
                      sanitizeForText(record.function, MAX_FUNCTION_LENGTH),
                      sanitizeForText(record.message, MAX_MESSAGE_LENGTH));
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    enabled_ = false;
    conn_.reset();
    std::cerr << "DatabaseLogWriter: connection lost, database logging "
                 "disabled: "
              << e.what() << std::endl;
    return false;
  } catch (const std::exception &e) {
    std::cerr << "DatabaseLogWriter: dropped log record: " << e.what()
              << std::endl;
    return false;
  }
}

void DatabaseLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
  enabled_ = false;
}

bool DatabaseLogWriter::isEnabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_ && conn_ && conn_->is_open();
}
