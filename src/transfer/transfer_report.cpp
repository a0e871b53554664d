#include "transfer/transfer_report.h"
#include "utils/string_utils.h"
#include <iomanip>
#include <sstream>

std::string coordinatorPhaseToString(CoordinatorPhase phase) {
  switch (phase) {
  case CoordinatorPhase::NOT_STARTED:
    return "NotStarted";
  case CoordinatorPhase::PROBE_RUNNING:
    return "ProbeRunning";
  case CoordinatorPhase::PROBE_CONFIRMED:
    return "ProbeConfirmed";
  case CoordinatorPhase::PARALLEL_RUNNING:
    return "ParallelRunning";
  case CoordinatorPhase::COMPLETED:
    return "Completed";
  case CoordinatorPhase::ABORTED:
    return "Aborted";
  default:
    return "Unknown";
  }
}

// Tables missing from the state count as pending.
void TransferReport::tally(const std::vector<TablePair> &workList,
                           const ProjectTransferState &state) {
  tables.clear();
  completed = mismatch = skipped = failed = pending = 0;
  totalRows = 0;

  for (const auto &pair : workList) {
    TableReport row;
    row.database = pair.database;
    row.table = pair.table;
    const TableTransferState *entry = state.find(pair.database, pair.table);
    if (entry) {
      row.status = entry->status;
      row.sourceRows = entry->sourceRows;
      row.destRows = entry->destRows;
      row.rowsTransferred = entry->rowsTransferred;
      row.discrepancy = entry->discrepancy;
      row.elapsedSeconds = entry->elapsedSeconds;
      row.reason = entry->error;
    }

    switch (row.status) {
    case TableStatus::COMPLETED:
      ++completed;
      totalRows += row.rowsTransferred;
      break;
    case TableStatus::MISMATCH:
      ++mismatch;
      break;
    case TableStatus::SKIPPED:
      ++skipped;
      break;
    case TableStatus::FAILED:
      ++failed;
      break;
    default:
      ++pending;
      if (row.reason.empty())
        row.reason = row.status == TableStatus::IN_PROGRESS
                         ? "interrupted"
                         : "not run";
      break;
    }
    tables.push_back(row);
  }
}

std::string TransferReport::summaryText() const {
  std::ostringstream out;
  out << "Project " << project << " (" << phaseToString(phase) << "): "
      << coordinatorPhaseToString(finalPhase) << "\n";
  out << "  completed: " << completed << "  mismatch: " << mismatch
      << "  skipped: " << skipped << "  failed: " << failed
      << "  pending: " << pending << "\n";
  out << "  total rows: " << totalRows
      << "  elapsed: " << StringUtils::formatDuration(elapsedSeconds) << "\n";

  for (const auto &row : tables) {
    out << "  " << std::left << std::setw(40)
        << (row.database + ".." + row.table) << std::setw(12)
        << statusToString(row.status) << std::right << std::setw(12)
        << row.rowsTransferred;
    if (!row.reason.empty())
      out << "  " << row.reason;
    out << "\n";
  }
  if (!message.empty())
    out << message << "\n";
  return out.str();
}
