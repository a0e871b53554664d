#include "transfer/table_worker_pool.h"
#include "core/logger.h"

// Starts numWorkers threads (at least one) that block on the job queue until
// shutdown.
TableWorkerPool::TableWorkerPool(size_t numWorkers) {
  if (numWorkers == 0) {
    numWorkers = 1;
  }

  workers_.reserve(numWorkers);
  for (size_t i = 0; i < numWorkers; ++i) {
    workers_.emplace_back(&TableWorkerPool::workerThread, this, i);
  }

  Logger::info(LogCategory::TRANSFER, "TableWorkerPool",
               "Created worker pool with " + std::to_string(numWorkers) +
                   " workers");
}

TableWorkerPool::~TableWorkerPool() { shutdown(); }

// Pops jobs until the queue is finished and drained. Every job produces
// exactly one completion, including jobs whose processor threw; the
// exception travels to the coordinator inside the completion.
void TableWorkerPool::workerThread(size_t workerId) {
  Logger::debug(LogCategory::TRANSFER, "TableWorkerPool",
                "Worker #" + std::to_string(workerId) + " started");

  TableJob job;
  while (jobs_.popBlocking(job)) {
    TableCompletion completion;
    completion.pair = job.pair;
    try {
      Logger::debug(LogCategory::TRANSFER, "TableWorkerPool",
                    "Worker #" + std::to_string(workerId) +
                        " processing table: " + job.pair.key());
      completion.outcome = job.processor(job.pair);
    } catch (const std::exception &e) {
      Logger::error(LogCategory::TRANSFER, "TableWorkerPool",
                    "Worker #" + std::to_string(workerId) +
                        " failed processing table: " + job.pair.key() +
                        " - Error: " + std::string(e.what()));
      completion.error = std::current_exception();
    }

    completedJobs_++;
    completions_.push(std::move(completion));
  }

  Logger::debug(LogCategory::TRANSFER, "TableWorkerPool",
                "Worker #" + std::to_string(workerId) + " stopped");
}

void TableWorkerPool::submit(
    const TablePair &pair,
    std::function<TableOutcome(const TablePair &)> processor) {
  if (shutdown_.load()) {
    Logger::warning(LogCategory::TRANSFER, "TableWorkerPool::submit",
                    "Cannot submit table - pool is shutting down: " +
                        pair.key());
    return;
  }
  jobs_.push(TableJob{pair, std::move(processor)});
}

bool TableWorkerPool::waitForCompletion(TableCompletion &completion) {
  return completions_.popBlocking(completion);
}

// Lets queued jobs finish, then joins every worker. Idempotent.
void TableWorkerPool::shutdown() {
  if (shutdown_.exchange(true)) {
    return;
  }

  jobs_.finish();
  for (auto &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  completions_.finish();

  Logger::debug(LogCategory::TRANSFER, "TableWorkerPool",
                "Worker pool stopped after " +
                    std::to_string(completedJobs_.load()) + " tables");
}
