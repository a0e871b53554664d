#ifndef TRANSFER_ERRORS_H
#define TRANSFER_ERRORS_H

#include <stdexcept>
#include <string>
#include <utility>

class TransferError : public std::runtime_error {
public:
  explicit TransferError(const std::string &message)
      : std::runtime_error(message) {}
};

// Server unreachable, login refused or link dropped mid-table. Eligible for a
// user-level retry of the whole table.
class ConnectionError : public TransferError {
public:
  explicit ConnectionError(const std::string &message)
      : TransferError(message) {}
};

// Table missing or column layout incompatible. Detected before the
// destination is touched; the table is skipped.
class SchemaError : public TransferError {
public:
  explicit SchemaError(const std::string &message) : TransferError(message) {}
};

// A statement or batch was rejected by the server.
class QueryError : public TransferError {
public:
  explicit QueryError(const std::string &message, std::string sqlState = "")
      : TransferError(message), sqlState_(std::move(sqlState)) {}

  const std::string &sqlState() const { return sqlState_; }

private:
  std::string sqlState_;
};

// The settings document could not be read or atomically replaced.
class PersistenceError : public TransferError {
public:
  explicit PersistenceError(const std::string &message)
      : TransferError(message) {}
};

class ConfigurationError : public TransferError {
public:
  explicit ConfigurationError(const std::string &message)
      : TransferError(message) {}
};

#endif
