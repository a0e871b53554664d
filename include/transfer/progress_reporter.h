#ifndef PROGRESS_REPORTER_H
#define PROGRESS_REPORTER_H

#include "state/transfer_state.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

struct TableProgress {
  std::string table;
  int64_t rowsDone = 0;
  int64_t rowsTotal = 0;
  bool finished = false;
  TableStatus status = TableStatus::IN_PROGRESS;
};

struct ProgressSnapshot {
  // In order of first report.
  std::vector<TableProgress> tables;
  size_t finishedCount = 0;
  uint64_t version = 0;
};

// Write-only sink for worker progress. Each table keeps only its latest
// value, so memory is bounded by the number of tables however fast events
// arrive. A render thread hands snapshots to the renderer at a fixed rate
// (clamped to 2-4 Hz) and skips ticks where nothing changed.
class ProgressReporter {
public:
  using Renderer = std::function<void(const ProgressSnapshot &)>;

  explicit ProgressReporter(Renderer renderer, int refreshHz = 4);
  ~ProgressReporter();

  ProgressReporter(const ProgressReporter &) = delete;
  ProgressReporter &operator=(const ProgressReporter &) = delete;

  void update(const std::string &table, int64_t rowsDone, int64_t rowsTotal);
  void complete(const std::string &table, TableStatus status);
  ProgressSnapshot snapshot() const;

  void start();
  // Renders a final frame if anything changed since the last one.
  void stop();

  int refreshHz() const { return refreshHz_; }
  std::chrono::milliseconds refreshInterval() const {
    return std::chrono::milliseconds(1000 / refreshHz_);
  }

private:
  void renderLoop();
  void renderIfChanged();
  ProgressSnapshot snapshotUnlocked() const;
  TableProgress &entryUnlocked(const std::string &table);

  Renderer renderer_;
  int refreshHz_;

  mutable std::mutex mutex_;
  std::vector<TableProgress> tables_;
  std::unordered_map<std::string, size_t> index_;
  uint64_t version_ = 0;
  uint64_t renderedVersion_ = 0;

  std::mutex renderMutex_;
  std::condition_variable stopCv_;
  bool stopping_ = false;
  bool running_ = false;
  std::thread renderThread_;
};

#endif
