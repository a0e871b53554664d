#ifndef TRANSFER_COORDINATOR_H
#define TRANSFER_COORDINATOR_H

#include "engines/bulk_copy.h"
#include "engines/database_session.h"
#include "project/project_store.h"
#include "state/transfer_state_store.h"
#include "transfer/progress_reporter.h"
#include "transfer/table_transfer_worker.h"
#include "transfer/transfer_decisions.h"
#include "transfer/transfer_report.h"
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

// Drives one run of a project for one phase:
//
//   NotStarted -> ProbeRunning -> ProbeConfirmed -> ParallelRunning
//                      |                                 |
//                      +---------> Aborted <-------------+--> Completed
//
// The first table of the work list runs alone on the calling thread. After
// the shell confirms, the rest go to a pool of options.threads workers with
// at most that many tables in flight. A mismatch stops new dispatch until the
// shell answers retry, skip or abort. A stop request stops dispatch; tables
// already running finish and persist, and the run ends Aborted.
//
// ConfigurationError (project unreadable) and PersistenceError (state write
// failed) propagate to the caller; in-flight tables are drained first.
class TransferCoordinator {
public:
  using StopPredicate = std::function<bool()>;

  TransferCoordinator(std::shared_ptr<ProjectStore> projects,
                      std::shared_ptr<TransferStateStore> state,
                      std::shared_ptr<IConnectionFactory> factory,
                      std::shared_ptr<IBulkCopyRunner> bulkCopy,
                      ITransferDecisions &decisions, std::string dataDirectory);

  void setProgressReporter(ProgressReporter *reporter) { progress_ = reporter; }
  void setStopPredicate(StopPredicate predicate) {
    stopPredicate_ = std::move(predicate);
  }

  TransferReport run(const std::string &projectName, TransferPhase phase);

  void requestStop() { stopRequested_.store(true); }
  bool stopRequested() const;
  CoordinatorPhase phase() const { return phase_.load(); }

private:
  std::deque<TablePair> prepareWorkList(const std::string &projectName,
                                        const std::vector<TablePair> &all);
  TableOutcome runTable(const std::string &projectName,
                        const TableTransferWorker &worker,
                        TransferPhase phase, const TablePair &pair);
  void skipAfterMismatch(const std::string &projectName,
                         const TableOutcome &outcome);
  TransferReport finish(const std::string &projectName, TransferPhase phase,
                        const std::vector<TablePair> &workList,
                        CoordinatorPhase finalPhase, std::string message);

  std::shared_ptr<ProjectStore> projects_;
  std::shared_ptr<TransferStateStore> state_;
  std::shared_ptr<IConnectionFactory> factory_;
  std::shared_ptr<IBulkCopyRunner> bulkCopy_;
  ITransferDecisions &decisions_;
  std::string dataDirectory_;
  ProgressReporter *progress_ = nullptr;
  StopPredicate stopPredicate_;

  std::atomic<bool> stopRequested_{false};
  std::atomic<CoordinatorPhase> phase_{CoordinatorPhase::NOT_STARTED};
  std::chrono::steady_clock::time_point startTime_;
};

#endif
