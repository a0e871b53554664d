#ifndef TRANSFER_REPORT_H
#define TRANSFER_REPORT_H

#include "project/transfer_project.h"
#include "state/transfer_state.h"
#include "transfer/table_transfer_worker.h"
#include <cstdint>
#include <string>
#include <vector>

enum class CoordinatorPhase {
  NOT_STARTED,
  PROBE_RUNNING,
  PROBE_CONFIRMED,
  PARALLEL_RUNNING,
  COMPLETED,
  ABORTED
};

std::string coordinatorPhaseToString(CoordinatorPhase phase);

struct TableReport {
  std::string database;
  std::string table;
  TableStatus status = TableStatus::PENDING;
  int64_t sourceRows = 0;
  int64_t destRows = 0;
  int64_t rowsTransferred = 0;
  int64_t discrepancy = 0;
  double elapsedSeconds = 0.0;
  std::string reason;
};

struct TransferReport {
  std::string project;
  TransferPhase phase = TransferPhase::FULL;
  CoordinatorPhase finalPhase = CoordinatorPhase::NOT_STARTED;
  bool success = false;
  std::string message;

  std::vector<TableReport> tables;
  size_t completed = 0;
  size_t mismatch = 0;
  size_t skipped = 0;
  size_t failed = 0;
  size_t pending = 0;
  int64_t totalRows = 0;
  double elapsedSeconds = 0.0;

  // Fills tables and counters from the persisted state, in work-list order.
  void tally(const std::vector<TablePair> &workList,
             const ProjectTransferState &state);

  std::string summaryText() const;
};

#endif
