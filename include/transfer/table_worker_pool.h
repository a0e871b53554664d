#ifndef TABLE_WORKER_POOL_H
#define TABLE_WORKER_POOL_H

#include "project/transfer_project.h"
#include "transfer/table_transfer_worker.h"
#include "transfer/thread_safe_queue.h"
#include <atomic>
#include <exception>
#include <functional>
#include <thread>
#include <vector>

struct TableJob {
  TablePair pair;
  std::function<TableOutcome(const TablePair &)> processor;
};

// Result of one job. error is set when the processor threw (for example a
// PersistenceError from the state store); outcome is meaningless then.
struct TableCompletion {
  TablePair pair;
  TableOutcome outcome;
  std::exception_ptr error;
};

class TableWorkerPool {
private:
  std::vector<std::thread> workers_;
  ThreadSafeQueue<TableJob> jobs_;
  ThreadSafeQueue<TableCompletion> completions_;
  std::atomic<size_t> completedJobs_{0};
  std::atomic<bool> shutdown_{false};

  void workerThread(size_t workerId);

public:
  explicit TableWorkerPool(size_t numWorkers);
  ~TableWorkerPool();

  TableWorkerPool(const TableWorkerPool &) = delete;
  TableWorkerPool &operator=(const TableWorkerPool &) = delete;

  void submit(const TablePair &pair,
              std::function<TableOutcome(const TablePair &)> processor);

  // Blocks until some job finishes.
  bool waitForCompletion(TableCompletion &completion);

  void shutdown();
};

#endif
