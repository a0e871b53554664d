#ifndef TABLE_TRANSFER_WORKER_H
#define TABLE_TRANSFER_WORKER_H

#include "engines/bulk_copy.h"
#include "engines/database_session.h"
#include "project/transfer_project.h"
#include "state/transfer_state.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class TransferPhase { FULL, EXTRACT, INSERT };

std::string phaseToString(TransferPhase phase);

struct TableOutcome {
  TablePair pair;
  TableStatus status = TableStatus::FAILED;
  int64_t sourceRows = 0;
  int64_t destRowsBefore = 0;
  int64_t destRowsAfter = 0;
  int64_t rowsTransferred = 0;
  // expected - actual; non-zero only for a mismatch.
  int64_t discrepancy = 0;
  double elapsedSeconds = 0.0;
  std::string error;

  TableTransition toTransition() const;
};

using ProgressCallback = std::function<void(int64_t rowsDone, int64_t rowsTotal)>;

// Moves one table and verifies the row counts. Stateless between calls, so
// one instance is shared by every pool thread; each run() opens its own
// sessions and owns them for the duration of the table.
//
// Exceptions never leave run(): SchemaError becomes skipped, every other
// failure becomes failed with the message as the reason.
class TableTransferWorker {
public:
  TableTransferWorker(std::shared_ptr<IConnectionFactory> factory,
                      std::shared_ptr<IBulkCopyRunner> bulkCopy,
                      TransferProject project, std::string dataDirectory);

  TableOutcome run(const TablePair &pair, TransferPhase phase,
                   const ProgressCallback &onProgress) const;

private:
  void runFull(const TablePair &pair, const ProgressCallback &onProgress,
               TableOutcome &outcome) const;
  void runExtract(const TablePair &pair, const ProgressCallback &onProgress,
                  TableOutcome &outcome) const;
  void runInsert(const TablePair &pair, const ProgressCallback &onProgress,
                 TableOutcome &outcome) const;

  // Destination table must exist and hold every source column.
  std::vector<ColumnInfo>
  checkDestination(IDatabaseSession &destination, const TablePair &pair,
                   const std::vector<ColumnInfo> &sourceColumns) const;

  // Truncate (TRUNCATE) or baseline count (APPEND), stream reader into the
  // destination, then verify. sourceRows must already be set on outcome.
  void loadAndVerify(IDatabaseSession &destination, IRowReader &reader,
                     const TablePair &pair,
                     const std::vector<ColumnInfo> &sourceColumns,
                     const std::vector<ColumnInfo> &destinationColumns,
                     const ProgressCallback &onProgress,
                     TableOutcome &outcome) const;

  std::shared_ptr<IConnectionFactory> factory_;
  std::shared_ptr<IBulkCopyRunner> bulkCopy_;
  TransferProject project_;
  std::string dataDirectory_;
};

#endif
