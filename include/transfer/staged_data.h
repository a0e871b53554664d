#ifndef STAGED_DATA_H
#define STAGED_DATA_H

#include "engines/database_session.h"
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Staging files written by an extract-only run and consumed by a later
// insert-only run. Each project stages under its own directory,
// <dataDir>/transfer_data_<project>/, holding <db>_<table>.dat files:
//
//   line 1: column names, tab separated
//   line 2: column types, tab separated
//   then one row per line
//
// Fields escape '\\', tab, CR and LF as \\, \t, \r and \n; SQL NULL is \N.
// An empty field is the empty string.

std::string escapeStagedField(const std::optional<std::string> &value);
// Throws TransferError on a dangling or unknown escape.
std::optional<std::string> unescapeStagedField(const std::string &field);

// Writes to "<path>.part" and renames it into place on commit(), so an
// interrupted extract never leaves a complete-looking file behind.
class StagedDataWriter {
public:
  StagedDataWriter(std::string path, const std::vector<ColumnInfo> &columns);
  ~StagedDataWriter();

  StagedDataWriter(const StagedDataWriter &) = delete;
  StagedDataWriter &operator=(const StagedDataWriter &) = delete;

  void writeRows(const std::vector<Row> &rows);
  void commit();
  int64_t rowsWritten() const { return rowsWritten_; }

private:
  std::string path_;
  std::string partPath_;
  std::ofstream out_;
  size_t columnCount_;
  int64_t rowsWritten_ = 0;
  bool committed_ = false;
};

class StagedDataReader : public IRowReader {
public:
  explicit StagedDataReader(const std::string &path);

  const std::vector<ColumnInfo> &columns() const override { return columns_; }
  size_t fetch(std::vector<Row> &out, size_t maxRows) override;

private:
  std::string path_;
  std::ifstream in_;
  std::vector<ColumnInfo> columns_;
  int64_t lineNumber_ = 0;
};

// Per-database record of what the extract phase produced:
// <dataDir>/transfer_data_<project>/<db>_manifest.json.
class StagingManifest {
public:
  struct Entry {
    int64_t sourceRows = 0;
    int64_t rowsWritten = 0;
    std::string extractedAt;
  };

  // Characters outside [A-Za-z0-9_.-] in the project name become '_'.
  static std::string projectDirectory(const std::string &dataDirectory,
                                      const std::string &project);
  static std::string dataFilePath(const std::string &dataDirectory,
                                  const std::string &project,
                                  const std::string &database,
                                  const std::string &table);
  static std::string manifestPath(const std::string &dataDirectory,
                                  const std::string &project,
                                  const std::string &database);

  static void recordTable(const std::string &dataDirectory,
                          const std::string &project,
                          const std::string &database,
                          const std::string &table, int64_t sourceRows,
                          int64_t rowsWritten);
  static std::optional<Entry> lookup(const std::string &dataDirectory,
                                     const std::string &project,
                                     const std::string &database,
                                     const std::string &table);

private:
  static std::mutex manifestMutex_;
};

#endif
