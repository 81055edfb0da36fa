#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// Transfer missing, not in STARTED, or claimed by another worker.
class TransferRejectedError : public std::runtime_error {
public:
  explicit TransferRejectedError(const std::string &message)
      : std::runtime_error(message) {}
};

class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string &message)
      : std::runtime_error(message) {}
};

class ConnectivityError : public std::runtime_error {
public:
  explicit ConnectivityError(const std::string &message)
      : std::runtime_error(message) {}
};

// Staging, upsert, teardown or upload failure inside a loader.
class LoadError : public std::runtime_error {
public:
  explicit LoadError(const std::string &message)
      : std::runtime_error(message) {}
};

class WatermarkParseError : public ConfigurationError {
public:
  explicit WatermarkParseError(const std::string &message)
      : ConfigurationError(message) {}
};

class PreconditionFailedError : public std::runtime_error {
public:
  PreconditionFailedError(const std::string &code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  const std::string &code() const { return code_; }

private:
  std::string code_;
};

class NotFoundError : public std::runtime_error {
public:
  explicit NotFoundError(const std::string &message)
      : std::runtime_error(message) {}
};

#endif
