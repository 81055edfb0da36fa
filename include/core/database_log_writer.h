#ifndef DATABASE_LOG_WRITER_H
#define DATABASE_LOG_WRITER_H

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

// One row of sharesync.logs. level and category are already rendered.
struct LogRecord {
  std::string level;
  std::string category;
  std::string function;
  std::string message;
};

// Appends log records to sharesync.logs in the catalog database over a
// single long-lived connection. Losing that connection disables the sink
// for the rest of the process; the console keeps receiving everything.
class DatabaseLogWriter {
  std::unique_ptr<pqxx::connection> conn_;
  bool statementPrepared_ = false;
  bool enabled_ = true;
  mutable std::mutex mutex_;

  void prepareInsert();

public:
  explicit DatabaseLogWriter(const std::string &connectionString);
  ~DatabaseLogWriter() { close(); }

  DatabaseLogWriter(const DatabaseLogWriter &) = delete;
  DatabaseLogWriter &operator=(const DatabaseLogWriter &) = delete;

  // False when the record could not be stored.
  bool write(const LogRecord &record);
  void close();
  bool isEnabled() const;
};

#endif
