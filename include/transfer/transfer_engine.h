#ifndef TRANSFER_ENGINE_H
#define TRANSFER_ENGINE_H

#include "engines/bulk_copy.h"
#include "engines/database_session.h"
#include "project/project_store.h"
#include "state/transfer_state_store.h"
#include "transfer/progress_reporter.h"
#include "transfer/transfer_coordinator.h"
#include "transfer/transfer_decisions.h"
#include "transfer/transfer_report.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

// Entry point used by the shell. Each phase keeps its own state section, so
// an extract-only run never marks a later insert-only run as done.
//
// Fatal errors (unreadable project, failed state write, a throwing decision
// hook) come back as a report with success == false and the message; nothing
// is thrown.
class TransferEngine {
public:
  TransferEngine(std::shared_ptr<ProjectStore> projects,
                 std::shared_ptr<IConnectionFactory> factory,
                 std::shared_ptr<IBulkCopyRunner> bulkCopy,
                 std::string dataDirectory, int refreshHz = 4);

  TransferEngine(const TransferEngine &) = delete;
  TransferEngine &operator=(const TransferEngine &) = delete;

  TransferReport runFull(const std::string &project,
                         ITransferDecisions &decisions);
  TransferReport runExtractOnly(const std::string &project,
                                ITransferDecisions &decisions);
  TransferReport runInsertOnly(const std::string &project,
                               ITransferDecisions &decisions);

  // Without a renderer no progress is drawn.
  void setProgressRenderer(ProgressReporter::Renderer renderer) {
    renderer_ = std::move(renderer);
  }
  void setStopPredicate(TransferCoordinator::StopPredicate predicate) {
    stopPredicate_ = std::move(predicate);
  }
  void requestStop();

  // Clears the state of every phase.
  void resetState(const std::string &project);
  ProjectTransferState status(const std::string &project, TransferPhase phase);

private:
  TransferReport runPhase(const std::string &project, TransferPhase phase,
                          ITransferDecisions &decisions);
  std::shared_ptr<TransferStateStore> storeFor(TransferPhase phase) const;

  std::shared_ptr<ProjectStore> projects_;
  std::shared_ptr<IConnectionFactory> factory_;
  std::shared_ptr<IBulkCopyRunner> bulkCopy_;
  std::string dataDirectory_;
  int refreshHz_;

  std::shared_ptr<TransferStateStore> fullState_;
  std::shared_ptr<TransferStateStore> extractState_;
  std::shared_ptr<TransferStateStore> insertState_;

  ProgressReporter::Renderer renderer_;
  TransferCoordinator::StopPredicate stopPredicate_;
  std::atomic<bool> stopRequested_{false};
};

#endif
