#include "transfer/progress_reporter.h"
#include "core/transfer_defaults.h"
#include <algorithm>

ProgressReporter::ProgressReporter(Renderer renderer, int refreshHz)
    : renderer_(std::move(renderer)),
      refreshHz_(std::max(TransferDefaults::MIN_PROGRESS_HZ,
                          std::min(refreshHz,
                                   TransferDefaults::MAX_PROGRESS_HZ))) {}

ProgressReporter::~ProgressReporter() { stop(); }

TableProgress &ProgressReporter::entryUnlocked(const std::string &table) {
  auto it = index_.find(table);
  if (it != index_.end())
    return tables_[it->second];
  index_[table] = tables_.size();
  TableProgress entry;
  entry.table = table;
  tables_.push_back(entry);
  return tables_.back();
}

// Records the latest counts of a table. Only the newest values are kept
// between two frames.
void ProgressReporter::update(const std::string &table, int64_t rowsDone,
                              int64_t rowsTotal) {
  std::lock_guard<std::mutex> lock(mutex_);
  TableProgress &entry = entryUnlocked(table);
  entry.rowsDone = rowsDone;
  entry.rowsTotal = rowsTotal;
  if (entry.finished) {
    // A retried table starts over.
    entry.finished = false;
    entry.status = TableStatus::IN_PROGRESS;
  }
  ++version_;
}

void ProgressReporter::complete(const std::string &table, TableStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  TableProgress &entry = entryUnlocked(table);
  entry.finished = true;
  entry.status = status;
  ++version_;
}

ProgressSnapshot ProgressReporter::snapshotUnlocked() const {
  ProgressSnapshot snap;
  snap.tables = tables_;
  snap.version = version_;
  for (const auto &entry : tables_) {
    if (entry.finished)
      ++snap.finishedCount;
  }
  return snap;
}

ProgressSnapshot ProgressReporter::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshotUnlocked();
}

void ProgressReporter::renderIfChanged() {
  ProgressSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (version_ == renderedVersion_)
      return;
    snap = snapshotUnlocked();
    renderedVersion_ = snap.version;
  }
  if (renderer_)
    renderer_(snap);
}

// Draws a frame per tick when something changed since the last frame.
void ProgressReporter::renderLoop() {
  std::unique_lock<std::mutex> lock(renderMutex_);
  while (!stopping_) {
    stopCv_.wait_for(lock, refreshInterval(), [this] { return stopping_; });
    if (stopping_)
      break;
    lock.unlock();
    renderIfChanged();
    lock.lock();
  }
}

void ProgressReporter::start() {
  std::lock_guard<std::mutex> lock(renderMutex_);
  if (running_)
    return;
  stopping_ = false;
  running_ = true;
  renderThread_ = std::thread(&ProgressReporter::renderLoop, this);
}

// Joins the render thread, then draws one last frame if anything changed.
void ProgressReporter::stop() {
  {
    std::lock_guard<std::mutex> lock(renderMutex_);
    if (!running_)
      return;
    stopping_ = true;
  }
  stopCv_.notify_all();
  if (renderThread_.joinable())
    renderThread_.join();
  {
    std::lock_guard<std::mutex> lock(renderMutex_);
    running_ = false;
  }
  renderIfChanged();
}
