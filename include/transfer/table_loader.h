#ifndef TABLE_LOADER_H
#define TABLE_LOADER_H

#include "engines/bulk_copy.h"
#include "engines/database_session.h"
#include "project/transfer_project.h"
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

// Write side of a table transfer. Rows arrive in source column order, one
// batch at a time.
class ITableLoader {
public:
  virtual ~ITableLoader() = default;

  virtual void writeBatch(const std::vector<Row> &rows) = 0;
  // Completes the load; returns the number of rows the loader delivered.
  virtual int64_t finish() = 0;
};

// One transaction per batch through IDatabaseSession::insertRows.
class InsertBatchLoader : public ITableLoader {
public:
  InsertBatchLoader(IDatabaseSession &destination, std::string database,
                    std::string table, std::vector<ColumnInfo> columns);

  void writeBatch(const std::vector<Row> &rows) override;
  int64_t finish() override { return rowsLoaded_; }

private:
  IDatabaseSession &destination_;
  std::string database_;
  std::string table_;
  std::vector<ColumnInfo> columns_;
  int64_t rowsLoaded_ = 0;
};

// Spools rows into a bcp character-format file in destination column order,
// then runs one "bcp in" on finish(). bcp -c has no escaping and loads an
// empty field as NULL, so a value containing a tab or line break, or an empty
// string, fails the table.
class BulkCopyLoader : public ITableLoader {
public:
  BulkCopyLoader(IBulkCopyRunner &runner, ConnectionDescriptor destination,
                 std::string database, std::string table,
                 const std::vector<ColumnInfo> &sourceColumns,
                 const std::vector<ColumnInfo> &destinationColumns,
                 std::string spoolPath);
  ~BulkCopyLoader() override;

  void writeBatch(const std::vector<Row> &rows) override;
  int64_t finish() override;

private:
  IBulkCopyRunner &runner_;
  ConnectionDescriptor destination_;
  std::string database_;
  std::string table_;
  std::string spoolPath_;
  std::ofstream spool_;
  // For each destination column, the source position feeding it or -1.
  std::vector<int> sourceIndex_;
  int64_t rowsSpooled_ = 0;
};

struct LoaderContext {
  LoadMethod method = LoadMethod::INSERT;
  IDatabaseSession *destination = nullptr;
  IBulkCopyRunner *bulkCopy = nullptr;
  ConnectionDescriptor destinationConnection;
  std::string database;
  std::string table;
  std::vector<ColumnInfo> sourceColumns;
  std::vector<ColumnInfo> destinationColumns;
  std::string spoolDirectory;
};

std::unique_ptr<ITableLoader> createTableLoader(const LoaderContext &context);

#endif
