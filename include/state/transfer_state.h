#ifndef TRANSFER_STATE_H
#define TRANSFER_STATE_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class TableStatus {
  PENDING,
  IN_PROGRESS,
  COMPLETED,
  MISMATCH,
  FAILED,
  SKIPPED
};

std::string statusToString(TableStatus status);
// Throws std::invalid_argument for unknown names.
TableStatus parseStatus(const std::string &value);

// pending -> in_progress -> {completed | mismatch | failed | skipped}.
// Anything but completed may re-enter in_progress (resume, retry); a
// mismatch may be settled as skipped by the user.
bool isValidTransition(TableStatus from, TableStatus to);

struct TableTransferState {
  std::string database;
  std::string table;
  TableStatus status = TableStatus::PENDING;
  int64_t sourceRows = 0;
  int64_t destRows = 0;
  int64_t destRowsBefore = 0;
  int64_t rowsTransferred = 0;
  int64_t discrepancy = 0;
  double elapsedSeconds = 0.0;
  std::string error;

  std::string key() const { return database + ".." + table; }
};

// A change submitted to TransferStateStore::record. Unset metrics keep their
// previous value.
struct TableTransition {
  TableStatus status = TableStatus::PENDING;
  std::optional<int64_t> sourceRows;
  std::optional<int64_t> destRows;
  std::optional<int64_t> destRowsBefore;
  std::optional<int64_t> rowsTransferred;
  std::optional<int64_t> discrepancy;
  std::optional<double> elapsedSeconds;
  std::optional<std::string> error;

  static TableTransition to(TableStatus status) {
    TableTransition t;
    t.status = status;
    return t;
  }
};

struct ProjectTransferState {
  std::string startedAt;
  std::string lastUpdate;
  std::vector<TableTransferState> tables;

  bool empty() const { return tables.empty() && startedAt.empty(); }
  const TableTransferState *find(const std::string &database,
                                 const std::string &table) const;
  // Tables without an entry read as pending.
  TableStatus statusOf(const std::string &database,
                       const std::string &table) const;
  bool hasIncompleteWork() const;
  size_t countWithStatus(TableStatus status) const;

  nlohmann::ordered_json toJson() const;
  // Throws std::invalid_argument on a malformed document.
  static ProjectTransferState fromJson(const nlohmann::ordered_json &node);
};

#endif
