#include "cli/console_shell.h"
#include "test_fixtures.h"
#include "test_runner.h"
#include "transfer/progress_reporter.h"
#include <atomic>
#include <iostream>
#include <sstream>
#include <thread>

namespace {

struct FrameLog {
  std::mutex mutex;
  std::vector<ProgressSnapshot> frames;

  ProgressReporter::Renderer renderer() {
    return [this](const ProgressSnapshot &snapshot) {
      std::lock_guard<std::mutex> lock(mutex);
      frames.push_back(snapshot);
    };
  }

  size_t count() {
    std::lock_guard<std::mutex> lock(mutex);
    return frames.size();
  }

  ProgressSnapshot last() {
    std::lock_guard<std::mutex> lock(mutex);
    return frames.empty() ? ProgressSnapshot() : frames.back();
  }
};

} // namespace

int main() {
  TestRunner runner;
  initTestLogger("test_progress_reporter.log");

  std::cout << "\n========================================" << std::endl;
  std::cout << "PROGRESS REPORTER TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Refresh rate is clamped to 2-4 Hz", [&]() {
    ProgressReporter slow(nullptr, 1);
    ProgressReporter fast(nullptr, 60);
    ProgressReporter normal(nullptr, 3);
    runner.assertEquals(2, slow.refreshHz(), "1 Hz raised to 2");
    runner.assertEquals(4, fast.refreshHz(), "60 Hz lowered to 4");
    runner.assertEquals(3, normal.refreshHz(), "3 Hz kept");
    runner.assertEquals(250, fast.refreshInterval().count(), "250ms interval");
  });

  runner.runTest("Only the latest value per table is kept", [&]() {
    ProgressReporter reporter(nullptr);
    for (int i = 1; i <= 10000; ++i)
      reporter.update("db..big", i, 10000);
    reporter.update("db..small", 5, 10);

    ProgressSnapshot snap = reporter.snapshot();
    runner.assertEquals(2, static_cast<int64_t>(snap.tables.size()),
                        "One entry per table");
    runner.assertEquals("db..big", snap.tables[0].table,
                        "Order of first report");
    runner.assertEquals(10000, snap.tables[0].rowsDone, "Latest value wins");
    runner.assertEquals(0, static_cast<int64_t>(snap.finishedCount),
                        "Nothing finished");
  });

  runner.runTest("Burst of updates renders at the refresh rate", [&]() {
    FrameLog log;
    ProgressReporter reporter(log.renderer(), 4);
    reporter.start();

    std::atomic<bool> running{true};
    std::thread producer([&]() {
      int64_t n = 0;
      while (running.load())
        reporter.update("db..t", ++n, 0);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    running.store(false);
    producer.join();
    reporter.stop();

    // About 4 ticks plus the final frame; allow scheduling slack.
    size_t frames = log.count();
    runner.assertTrue(frames >= 2 && frames <= 7,
                      "Unexpected frame count " + std::to_string(frames));
  });

  runner.runTest("No frames while nothing changes", [&]() {
    FrameLog log;
    ProgressReporter reporter(log.renderer(), 4);
    reporter.update("db..t", 1, 10);
    reporter.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    size_t afterFirst = log.count();
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    reporter.stop();

    runner.assertEquals(1, static_cast<int64_t>(afterFirst),
                        "One frame for the single change");
    runner.assertEquals(1, static_cast<int64_t>(log.count()),
                        "Idle ticks render nothing");
  });

  runner.runTest("Stop renders the final state", [&]() {
    FrameLog log;
    ProgressReporter reporter(log.renderer(), 2);
    reporter.start();
    reporter.update("db..a", 10, 10);
    reporter.complete("db..a", TableStatus::COMPLETED);
    reporter.stop();

    ProgressSnapshot last = log.last();
    runner.assertEquals(1, static_cast<int64_t>(last.finishedCount),
                        "Final frame shows the table finished");
    size_t frames = log.count();
    reporter.stop();
    runner.assertEquals(static_cast<int64_t>(frames),
                        static_cast<int64_t>(log.count()),
                        "Second stop renders nothing");
  });

  runner.runTest("A retried table counts as unfinished again", [&]() {
    ProgressReporter reporter(nullptr);
    reporter.update("db..a", 100, 100);
    reporter.complete("db..a", TableStatus::MISMATCH);
    runner.assertEquals(1, static_cast<int64_t>(reporter.snapshot().finishedCount),
                        "Finished after mismatch");

    reporter.update("db..a", 0, 100);
    ProgressSnapshot snap = reporter.snapshot();
    runner.assertEquals(0, static_cast<int64_t>(snap.finishedCount),
                        "Retry clears the finished flag");
    runner.assertTrue(snap.tables[0].status == TableStatus::IN_PROGRESS,
                      "Status back to in_progress");
  });

  runner.runTest("Progress bar text", [&]() {
    runner.assertEquals("[#####-----]  50%   50/100 rows",
                        ConsoleView::progressBar(50, 100, 10), "Half way");
    runner.assertEquals("[----------]   0%   0/0 rows",
                        ConsoleView::progressBar(0, 0, 10), "Unknown total");
    runner.assertEquals("[##########] 100%   120/100 rows",
                        ConsoleView::progressBar(120, 100, 10),
                        "Over-count is capped at 100%");
  });

  runner.runTest("Console renderer lists unfinished tables only", [&]() {
    std::ostringstream out;
    std::mutex outputMutex;
    auto render = ConsoleView::makeRenderer(out, outputMutex);

    ProgressSnapshot snap;
    TableProgress running;
    running.table = "sbnmaster..users";
    running.rowsDone = 10;
    running.rowsTotal = 20;
    TableProgress done;
    done.table = "sbnmaster..branches";
    done.finished = true;
    done.status = TableStatus::COMPLETED;
    snap.tables = {running, done};
    snap.finishedCount = 1;
    render(snap);

    std::string text = out.str();
    runner.assertContains(text, "sbnmaster..users", "Running table shown");
    runner.assertFalse(text.find("sbnmaster..branches") != std::string::npos,
                       "Finished table hidden");
    runner.assertContains(text, "finished 1/2 tables", "Summary line");
  });

  Logger::shutdown();
  runner.printSummary();
  return 0;
}
