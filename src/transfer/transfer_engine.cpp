#include "transfer/transfer_engine.h"
#include "core/logger.h"
#include "core/transfer_defaults.h"
#include "core/transfer_errors.h"

TransferEngine::TransferEngine(std::shared_ptr<ProjectStore> projects,
                               std::shared_ptr<IConnectionFactory> factory,
                               std::shared_ptr<IBulkCopyRunner> bulkCopy,
                               std::string dataDirectory, int refreshHz)
    : projects_(std::move(projects)), factory_(std::move(factory)),
      bulkCopy_(std::move(bulkCopy)), dataDirectory_(std::move(dataDirectory)),
      refreshHz_(refreshHz) {
  fullState_ = std::make_shared<TransferStateStore>(
      projects_, TransferDefaults::FULL_STATE_KEY);
  extractState_ = std::make_shared<TransferStateStore>(
      projects_, TransferDefaults::EXTRACT_STATE_KEY);
  insertState_ = std::make_shared<TransferStateStore>(
      projects_, TransferDefaults::INSERT_STATE_KEY);
}

std::shared_ptr<TransferStateStore>
TransferEngine::storeFor(TransferPhase phase) const {
  switch (phase) {
  case TransferPhase::EXTRACT:
    return extractState_;
  case TransferPhase::INSERT:
    return insertState_;
  case TransferPhase::FULL:
  default:
    return fullState_;
  }
}

TransferReport TransferEngine::runFull(const std::string &project,
                                       ITransferDecisions &decisions) {
  return runPhase(project, TransferPhase::FULL, decisions);
}

TransferReport TransferEngine::runExtractOnly(const std::string &project,
                                              ITransferDecisions &decisions) {
  return runPhase(project, TransferPhase::EXTRACT, decisions);
}

TransferReport TransferEngine::runInsertOnly(const std::string &project,
                                             ITransferDecisions &decisions) {
  return runPhase(project, TransferPhase::INSERT, decisions);
}

void TransferEngine::requestStop() {
  stopRequested_.store(true);
  Logger::warning(LogCategory::TRANSFER, "TransferEngine",
                  "Stop requested; running tables will finish first");
}

// Runs one phase of a project under a fresh coordinator with this phase's
// state store. Progress is drawn only while the coordinator runs. Any error
// that ends the run early is logged and returned as an aborted report.
TransferReport TransferEngine::runPhase(const std::string &project,
                                        TransferPhase phase,
                                        ITransferDecisions &decisions) {
  stopRequested_.store(false);

  TransferCoordinator coordinator(projects_, storeFor(phase), factory_,
                                  bulkCopy_, decisions, dataDirectory_);
  coordinator.setStopPredicate([this]() {
    return stopRequested_.load() || (stopPredicate_ && stopPredicate_());
  });

  std::unique_ptr<ProgressReporter> progress;
  if (renderer_) {
    progress = std::make_unique<ProgressReporter>(renderer_, refreshHz_);
    coordinator.setProgressReporter(progress.get());
    progress->start();
  }

  Logger::info(LogCategory::TRANSFER, "TransferEngine",
               "Starting " + phaseToString(phase) + " run of '" + project +
                   "'");

  TransferReport report;
  bool fatal = false;
  try {
    report = coordinator.run(project, phase);
  } catch (const ConfigurationError &e) {
    fatal = true;
    report.message = std::string("Configuration error: ") + e.what();
  } catch (const PersistenceError &e) {
    fatal = true;
    report.message = std::string("State could not be saved: ") + e.what();
  } catch (const std::exception &e) {
    fatal = true;
    report.message = std::string("Run halted: ") + e.what();
  }

  if (progress)
    progress->stop();

  if (fatal) {
    report.project = project;
    report.phase = phase;
    report.finalPhase = CoordinatorPhase::ABORTED;
    report.success = false;
    Logger::error(LogCategory::TRANSFER, "TransferEngine", report.message);
  }
  return report;
}

// Clears the state of every phase so the next run starts fresh.
void TransferEngine::resetState(const std::string &project) {
  if (!projects_->exists(project)) {
    throw ConfigurationError("Project '" + project + "' does not exist");
  }
  fullState_->clear(project);
  extractState_->clear(project);
  insertState_->clear(project);
  Logger::info(LogCategory::STATE, "TransferEngine",
               "Cleared transfer state of '" + project + "'");
}

ProjectTransferState TransferEngine::status(const std::string &project,
                                            TransferPhase phase) {
  return storeFor(phase)->load(project).state;
}
