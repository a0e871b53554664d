#include "transfer/transfer_coordinator.h"
#include "core/logger.h"
#include "core/transfer_errors.h"
#include "transfer/table_worker_pool.h"
#include "utils/time_utils.h"
#include <algorithm>

TransferCoordinator::TransferCoordinator(
    std::shared_ptr<ProjectStore> projects,
    std::shared_ptr<TransferStateStore> state,
    std::shared_ptr<IConnectionFactory> factory,
    std::shared_ptr<IBulkCopyRunner> bulkCopy, ITransferDecisions &decisions,
    std::string dataDirectory)
    : projects_(std::move(projects)), state_(std::move(state)),
      factory_(std::move(factory)), bulkCopy_(std::move(bulkCopy)),
      decisions_(decisions), dataDirectory_(std::move(dataDirectory)) {}

bool TransferCoordinator::stopRequested() const {
  if (stopRequested_.load())
    return true;
  return stopPredicate_ && stopPredicate_();
}

// Decides what this run has to do. With no previous state, or a previous run
// that completed, every table is queued. Otherwise the decision hook chooses
// between resuming (tables not yet completed, in mapping order) and starting
// over.
std::deque<TablePair>
TransferCoordinator::prepareWorkList(const std::string &projectName,
                                     const std::vector<TablePair> &all) {
  TransferStateStore::LoadResult previous = state_->load(projectName);

  if (previous.state.tables.empty()) {
    state_->begin(projectName, all, true);
    return std::deque<TablePair>(all.begin(), all.end());
  }

  if (!previous.hasIncompleteWork) {
    Logger::info(LogCategory::STATE, "TransferCoordinator",
                 "Previous run of '" + projectName +
                     "' completed; starting a fresh run");
    state_->clear(projectName);
    state_->begin(projectName, all, true);
    return std::deque<TablePair>(all.begin(), all.end());
  }

  ResumeDecision decision = decisions_.onIncompleteRun(previous.state);
  if (decision == ResumeDecision::RESTART) {
    Logger::info(LogCategory::STATE, "TransferCoordinator",
                 "Discarding previous state of '" + projectName + "'");
    state_->clear(projectName);
    state_->begin(projectName, all, true);
    return std::deque<TablePair>(all.begin(), all.end());
  }

  std::deque<TablePair> remaining;
  for (const auto &pair : all) {
    if (previous.state.statusOf(pair.database, pair.table) !=
        TableStatus::COMPLETED) {
      remaining.push_back(pair);
    }
  }
  state_->begin(projectName, all, false);
  Logger::info(LogCategory::STATE, "TransferCoordinator",
               "Resuming '" + projectName + "': " +
                   std::to_string(remaining.size()) + " of " +
                   std::to_string(all.size()) + " tables left");
  return remaining;
}

// Marks the table in progress, runs it on the calling thread and persists the
// outcome. Called from the probe and from pool threads.
TableOutcome TransferCoordinator::runTable(const std::string &projectName,
                                           const TableTransferWorker &worker,
                                           TransferPhase phase,
                                           const TablePair &pair) {
  state_->record(projectName, pair.database, pair.table,
                 TableTransition::to(TableStatus::IN_PROGRESS));

  std::string key = pair.key();
  if (progress_)
    progress_->update(key, 0, 0);

  TableOutcome outcome =
      worker.run(pair, phase, [this, &key](int64_t done, int64_t total) {
        if (progress_)
          progress_->update(key, done, total);
      });

  state_->record(projectName, pair.database, pair.table,
                 outcome.toTransition());
  if (progress_)
    progress_->complete(key, outcome.status);
  return outcome;
}

void TransferCoordinator::skipAfterMismatch(const std::string &projectName,
                                            const TableOutcome &outcome) {
  TableTransition transition = TableTransition::to(TableStatus::SKIPPED);
  transition.error = "skipped by user after row count mismatch (discrepancy " +
                     std::to_string(outcome.discrepancy) + ")";
  state_->record(projectName, outcome.pair.database, outcome.pair.table,
                 transition);
  Logger::warning(LogCategory::VALIDATION, "TransferCoordinator",
                  outcome.pair.key() + " skipped with discrepancy " +
                      std::to_string(outcome.discrepancy));
  if (progress_)
    progress_->complete(outcome.pair.key(), TableStatus::SKIPPED);
}

// Builds the report from the persisted state and logs the tally.
TransferReport TransferCoordinator::finish(
    const std::string &projectName, TransferPhase phase,
    const std::vector<TablePair> &workList, CoordinatorPhase finalPhase,
    std::string message) {
  phase_.store(finalPhase);

  TransferReport report;
  report.project = projectName;
  report.phase = phase;
  report.finalPhase = finalPhase;
  report.message = std::move(message);
  report.tally(workList, state_->snapshot(projectName));
  report.elapsedSeconds = TimeUtils::secondsSince(startTime_);
  report.success = finalPhase == CoordinatorPhase::COMPLETED &&
                   report.failed == 0 && report.mismatch == 0 &&
                   report.pending == 0;

  Logger::info(LogCategory::TRANSFER, "TransferCoordinator",
               "Run of '" + projectName + "' (" + phaseToString(phase) +
                   ") ended " + coordinatorPhaseToString(finalPhase) + ": " +
                   std::to_string(report.completed) + " completed, " +
                   std::to_string(report.mismatch) + " mismatch, " +
                   std::to_string(report.skipped) + " skipped, " +
                   std::to_string(report.failed) + " failed, " +
                   std::to_string(report.totalRows) + " rows");
  return report;
}

// Runs the probe table alone, asks for confirmation, then dispatches the
// remaining tables to a pool of at most options.threads workers. A mismatch
// pauses dispatch until the decision hook answers; running tables carry on.
// A stop request lets running tables finish and dispatches nothing new.
// A TransferError that halts the run is logged and rethrown.
TransferReport TransferCoordinator::run(const std::string &projectName,
                                        TransferPhase phase) {
  startTime_ = std::chrono::steady_clock::now();
  phase_.store(CoordinatorPhase::NOT_STARTED);
  stopRequested_.store(false);

  TransferProject project = projects_->load(projectName);
  std::vector<TablePair> workList = buildWorkList(project);

  try {
    std::deque<TablePair> pending = prepareWorkList(projectName, workList);
    if (pending.empty()) {
      return finish(projectName, phase, workList, CoordinatorPhase::COMPLETED,
                    "Nothing left to transfer");
    }
    if (stopRequested()) {
      return finish(projectName, phase, workList, CoordinatorPhase::ABORTED,
                    "Stopped before the first table");
    }

    TableTransferWorker worker(factory_, bulkCopy_, project, dataDirectory_);
    const size_t threads = project.options.threads;

    phase_.store(CoordinatorPhase::PROBE_RUNNING);
    TablePair probe = pending.front();
    pending.pop_front();
    Logger::info(LogCategory::TRANSFER, "TransferCoordinator",
                 "Probe table: " + probe.key());

    TableOutcome probeOutcome;
    while (true) {
      probeOutcome = runTable(projectName, worker, phase, probe);
      if (probeOutcome.status != TableStatus::MISMATCH)
        break;

      MismatchDecision decision = decisions_.onMismatch(probeOutcome);
      if (decision == MismatchDecision::RETRY) {
        Logger::info(LogCategory::TRANSFER, "TransferCoordinator",
                     "Retrying probe table " + probe.key());
        continue;
      }
      if (decision == MismatchDecision::SKIP) {
        skipAfterMismatch(projectName, probeOutcome);
        probeOutcome.status = TableStatus::SKIPPED;
        break;
      }
      return finish(projectName, phase, workList, CoordinatorPhase::ABORTED,
                    "Aborted after mismatch on probe table " + probe.key());
    }

    if (pending.empty()) {
      return finish(projectName, phase, workList, CoordinatorPhase::COMPLETED,
                    "");
    }
    if (stopRequested()) {
      return finish(projectName, phase, workList, CoordinatorPhase::ABORTED,
                    "Stopped after the probe table; run again to resume");
    }
    if (!decisions_.confirmContinue(probeOutcome, pending.size(), threads)) {
      return finish(projectName, phase, workList, CoordinatorPhase::ABORTED,
                    "Run declined after the probe table; run again to resume");
    }
    phase_.store(CoordinatorPhase::PROBE_CONFIRMED);

    phase_.store(CoordinatorPhase::PARALLEL_RUNNING);
    std::exception_ptr fatal;
    bool aborted = false;
    std::string abortMessage;
    {
      TableWorkerPool pool(std::min(threads, pending.size()));
      auto processor = [this, &worker, phase,
                        &projectName](const TablePair &pair) {
        return runTable(projectName, worker, phase, pair);
      };

      size_t inFlight = 0;
      while (true) {
        bool halted = fatal || aborted || stopRequested();
        while (!halted && inFlight < threads && !pending.empty()) {
          pool.submit(pending.front(), processor);
          pending.pop_front();
          ++inFlight;
        }
        if (inFlight == 0)
          break;

        TableCompletion completion;
        if (!pool.waitForCompletion(completion))
          break;
        --inFlight;

        if (completion.error) {
          if (!fatal)
            fatal = completion.error;
          continue;
        }
        if (completion.outcome.status != TableStatus::MISMATCH || fatal ||
            aborted || stopRequested()) {
          continue;
        }

        // Dispatch waits here; running tables carry on.
        MismatchDecision decision = decisions_.onMismatch(completion.outcome);
        if (decision == MismatchDecision::RETRY) {
          Logger::info(LogCategory::TRANSFER, "TransferCoordinator",
                       "Re-queued " + completion.pair.key());
          pending.push_front(completion.pair);
        } else if (decision == MismatchDecision::SKIP) {
          try {
            skipAfterMismatch(projectName, completion.outcome);
          } catch (const PersistenceError &) {
            fatal = std::current_exception();
          }
        } else {
          aborted = true;
          abortMessage = "Aborted after mismatch on " + completion.pair.key();
          Logger::warning(LogCategory::TRANSFER, "TransferCoordinator",
                          abortMessage + "; waiting for running tables");
        }
      }
      pool.shutdown();
    }

    if (fatal) {
      std::rethrow_exception(fatal);
    }
    if (aborted) {
      return finish(projectName, phase, workList, CoordinatorPhase::ABORTED,
                    abortMessage);
    }
    if (stopRequested()) {
      return finish(projectName, phase, workList, CoordinatorPhase::ABORTED,
                    "Stopped on request; run again to resume");
    }
    return finish(projectName, phase, workList, CoordinatorPhase::COMPLETED,
                  "");
  } catch (const TransferError &e) {
    phase_.store(CoordinatorPhase::ABORTED);
    Logger::critical(LogCategory::TRANSFER, "TransferCoordinator",
                     "Run of '" + projectName + "' halted: " + e.what());
    throw;
  }
}
