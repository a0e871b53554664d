#ifndef DATABASE_SESSION_H
#define DATABASE_SESSION_H

#include "project/transfer_project.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ColumnInfo {
  std::string name;
  std::string dataType;
  bool nullable = true;
};

// Every value travels as character data; nullopt is SQL NULL.
using Row = std::vector<std::optional<std::string>>;

// Forward-only cursor over one table.
class IRowReader {
public:
  virtual ~IRowReader() = default;

  virtual const std::vector<ColumnInfo> &columns() const = 0;
  // Appends up to maxRows rows to out; returns how many were appended.
  // 0 means the cursor is exhausted.
  virtual size_t fetch(std::vector<Row> &out, size_t maxRows) = 0;
};

// One connection to one server. Not thread-safe; each worker owns its own.
// Failures are reported as ConnectionError (link lost, login refused) or
// QueryError (statement rejected).
class IDatabaseSession {
public:
  virtual ~IDatabaseSession() = default;

  virtual DatabasePlatform platform() const = 0;

  virtual void execute(const std::string &sql,
                       const std::string &database = "") = 0;
  virtual std::vector<Row> query(const std::string &sql,
                                 const std::string &database = "") = 0;

  virtual int64_t countRows(const std::string &database,
                            const std::string &table) = 0;
  // False when either the database or the table does not exist.
  virtual bool tableExists(const std::string &database,
                           const std::string &table) = 0;
  virtual std::vector<ColumnInfo> getColumns(const std::string &database,
                                             const std::string &table) = 0;
  virtual void truncateTable(const std::string &database,
                             const std::string &table) = 0;

  // Only one reader may be open on a session, and the session must not be
  // used for anything else until the reader is destroyed.
  virtual std::unique_ptr<IRowReader>
  openReader(const std::string &database, const std::string &table,
             const std::vector<ColumnInfo> &columns) = 0;

  // Inserts all rows in one transaction; nothing is committed on failure.
  virtual void insertRows(const std::string &database, const std::string &table,
                          const std::vector<ColumnInfo> &columns,
                          const std::vector<Row> &rows) = 0;

  virtual std::vector<std::string> listDatabases() = 0;
  virtual std::vector<std::string> listTables(const std::string &database) = 0;
};

class IConnectionFactory {
public:
  virtual ~IConnectionFactory() = default;

  // Throws ConnectionError when the server cannot be reached.
  virtual std::unique_ptr<IDatabaseSession>
  connect(const ConnectionDescriptor &descriptor) = 0;
};

#endif
