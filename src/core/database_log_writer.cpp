#include "core/database_log_writer.h"
#include "utils/string_utils.h"
#include <iostream>
#include <unistd.h>

namespace {

// Drops bytes that do not form valid UTF-8 sequences; PostgreSQL rejects the
// whole insert otherwise, and ODBC error texts from older servers are often
// Latin-1.
std::string sanitizeUTF8(const std::string &input) {
  std::string result;
  result.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    size_t len = 0;
    if (c < 0x80) {
      if (c >= 0x20 || c == '\n' || c == '\r' || c == '\t')
        result += static_cast<char>(c);
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
    } else {
      ++i;
      continue;
    }

    bool valid = i + len <= input.size();
    for (size_t k = 1; valid && k < len; ++k) {
      valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
    }
    if (valid) {
      result.append(input, i, len);
      i += len;
    } else {
      ++i;
    }
  }
  return result;
}

std::string localHostName() {
  char buffer[256];
  if (gethostname(buffer, sizeof(buffer)) == 0) {
    buffer[sizeof(buffer) - 1] = '\0';
    return std::string(buffer);
  }
  return "unknown";
}

} // namespace

DatabaseLogWriter::DatabaseLogWriter(const std::string &connectionString,
                                     const std::string &tableName)
    : connectionString_(connectionString), tableName_(tableName),
      hostName_(localHostName()), statementPrepared_(false), enabled_(true) {
  if (!StringUtils::isValidQualifiedIdentifier(tableName_)) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: invalid log table name '" << tableName_
              << "'" << std::endl;
    return;
  }

  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
    std::lock_guard<std::mutex> lock(mutex_);
    prepareStatementUnlocked();
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: Failed to establish connection: "
              << e.what() << std::endl;
  }
}

void DatabaseLogWriter::prepareStatementUnlocked() {
  if (!conn_ || !conn_->is_open() || statementPrepared_)
    return;

  try {
    conn_->prepare("transfer_log_insert",
                   "INSERT INTO " + tableName_ +
                       " (ts, level, category, function, message, host) "
                       "VALUES (NOW(), $1, $2, $3, $4, $5)");
    statementPrepared_ = true;
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: Failed to prepare statement: " << e.what()
              << std::endl;
  }
}

// Pre-formatted lines carry no structure to split into columns.
bool DatabaseLogWriter::write(const std::string &formattedMessage) {
  return writeParsed("INFO", "SYSTEM", "", formattedMessage);
}

bool DatabaseLogWriter::writeParsed(const std::string &levelStr,
                                    const std::string &categoryStr,
                                    const std::string &function,
                                    const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!enabled_ || !conn_ || !conn_->is_open()) {
    enabled_ = false;
    return false;
  }

  if (!statementPrepared_) {
    prepareStatementUnlocked();
    if (!statementPrepared_)
      return false;
  }

  std::string trimmedMessage =
      message.size() > 10000 ? message.substr(0, 10000) : message;

  try {
    pqxx::work txn(*conn_);
    txn.exec_prepared("transfer_log_insert", sanitizeUTF8(levelStr),
                      sanitizeUTF8(categoryStr), sanitizeUTF8(function),
                      sanitizeUTF8(trimmedMessage), hostName_);
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    enabled_ = false;
    conn_.reset();
    std::cerr << "DatabaseLogWriter: Connection broken: " << e.what()
              << std::endl;
    return false;
  } catch (const std::exception &e) {
    std::cerr << "DatabaseLogWriter: Failed to write log entry: " << e.what()
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
  return enabled_;
}

bool DatabaseLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return conn_ && conn_->is_open() && enabled_;
}
