#include "core/transfer_defaults.h"
#include "mocks/fake_database.h"
#include "project/project_store.h"
#include "state/transfer_state_store.h"
#include "test_fixtures.h"
#include "test_runner.h"
#include "transfer/transfer_coordinator.h"
#include "transfer/transfer_engine.h"
#include <atomic>
#include <deque>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

namespace {

const std::vector<ColumnInfo> kColumns = {{"id", "int", false},
                                          {"name", "varchar", true}};

// Canned answers for the coordinator's questions, with a record of what was
// asked.
class ScriptedDecisions : public ITransferDecisions {
public:
  ResumeDecision resume = ResumeDecision::RESUME;
  bool continueAfterProbe = true;
  std::deque<MismatchDecision> mismatchAnswers;
  std::function<void()> whileConfirming;

  int incompleteRunCalls = 0;
  int confirmCalls = 0;
  std::string probeTable;
  size_t remainingAtConfirm = 0;
  size_t threadsAtConfirm = 0;
  std::vector<std::string> mismatchTables;
  std::vector<int64_t> discrepancies;

  ResumeDecision onIncompleteRun(const ProjectTransferState &) override {
    ++incompleteRunCalls;
    return resume;
  }

  bool confirmContinue(const TableOutcome &probe, size_t remaining,
                       size_t threads) override {
    ++confirmCalls;
    if (whileConfirming)
      whileConfirming();
    probeTable = probe.pair.table;
    remainingAtConfirm = remaining;
    threadsAtConfirm = threads;
    return continueAfterProbe;
  }

  MismatchDecision onMismatch(const TableOutcome &outcome) override {
    mismatchTables.push_back(outcome.pair.table);
    discrepancies.push_back(outcome.discrepancy);
    if (mismatchAnswers.empty())
      return MismatchDecision::ABORT;
    MismatchDecision answer = mismatchAnswers.front();
    mismatchAnswers.pop_front();
    return answer;
  }
};

struct Fixture {
  ScratchDirectory dir{"coordinator"};
  std::shared_ptr<ProjectStore> projects;
  std::shared_ptr<FakeServer> source = std::make_shared<FakeServer>();
  std::shared_ptr<FakeServer> destination = std::make_shared<FakeServer>();
  std::shared_ptr<FakeConnectionFactory> factory =
      std::make_shared<FakeConnectionFactory>();
  std::shared_ptr<FakeBulkCopyRunner> bcp;

  Fixture() {
    projects = std::make_shared<ProjectStore>(dir.file("settings.json"));
    factory->addServer("src-host", source);
    factory->addServer("dst-host", destination);
    bcp = std::make_shared<FakeBulkCopyRunner>(destination);
  }

  void addTable(const std::string &table, int64_t sourceRows,
                int64_t destRows = 0) {
    source->addTable("sbnmaster", table, kColumns, sourceRows);
    destination->addTable("sbnmaster", table, kColumns, destRows);
  }

  void saveProject(const std::vector<std::string> &tables,
                   TransferMode mode = TransferMode::TRUNCATE,
                   size_t threads = 5) {
    projects->save(makeProject("p", tables, mode, threads));
  }

  std::unique_ptr<TransferEngine> engine() {
    return std::make_unique<TransferEngine>(projects, factory, bcp, dir.path());
  }

  std::shared_ptr<TransferStateStore> fullState() {
    return std::make_shared<TransferStateStore>(
        projects, TransferDefaults::FULL_STATE_KEY);
  }

  std::vector<std::string> loadOrder() const {
    std::vector<std::string> tables;
    for (const auto &key : destination->loadOrder())
      tables.push_back(key.substr(key.find("..") + 2));
    return tables;
  }
};

std::string joined(const std::vector<std::string> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty())
      out += ",";
    out += item;
  }
  return out;
}

const TableReport *findRow(const TransferReport &report,
                           const std::string &table) {
  for (const auto &row : report.tables) {
    if (row.table == table)
      return &row;
  }
  return nullptr;
}

} // namespace

int main() {
  TestRunner runner;
  initTestLogger("test_transfer_coordinator.log");

  std::cout << "\n========================================" << std::endl;
  std::cout << "TRANSFER COORDINATOR TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("APPEND with one thread: probe, confirm, then the rest",
                 [&]() {
                   Fixture f;
                   f.addTable("users", 5000);
                   f.addTable("branches", 8000);
                   f.saveProject({"users", "branches"}, TransferMode::APPEND,
                                 1);

                   std::vector<ProgressSnapshot> frames;
                   std::mutex framesMutex;
                   auto engine = f.engine();
                   engine->setProgressRenderer(
                       [&](const ProgressSnapshot &snapshot) {
                         std::lock_guard<std::mutex> lock(framesMutex);
                         frames.push_back(snapshot);
                       });

                   ScriptedDecisions decisions;
                   TransferReport report = engine->runFull("p", decisions);

                   runner.assertEquals(1, decisions.confirmCalls,
                                       "Confirmation asked once");
                   runner.assertEquals("users", decisions.probeTable,
                                       "users is the probe");
                   runner.assertEquals(
                       1, static_cast<int64_t>(decisions.remainingAtConfirm),
                       "One table remaining");
                   runner.assertEquals(
                       1, static_cast<int64_t>(decisions.threadsAtConfirm),
                       "One thread");
                   runner.assertEquals("users,branches", joined(f.loadOrder()),
                                       "users then branches");
                   runner.assertEquals(1, f.destination->maxConcurrentLoads(),
                                       "Never two tables at once");

                   runner.assertTrue(report.success, "Run succeeded");
                   runner.assertTrue(report.finalPhase ==
                                         CoordinatorPhase::COMPLETED,
                                     "Completed");
                   runner.assertEquals(2, static_cast<int64_t>(report.completed),
                                       "2 completed");
                   runner.assertEquals(0, static_cast<int64_t>(report.mismatch),
                                       "0 mismatches");
                   runner.assertEquals(13000, report.totalRows,
                                       "13000 total rows");

                   std::lock_guard<std::mutex> lock(framesMutex);
                   runner.assertFalse(frames.empty(), "Progress rendered");
                   if (!frames.empty()) {
                     runner.assertEquals(
                         2, static_cast<int64_t>(frames.back().finishedCount),
                         "Final frame shows both tables finished");
                   }
                 });

  runner.runTest("Resume runs exactly the unfinished tables in order", [&]() {
    Fixture f;
    f.addTable("a", 10);
    f.addTable("b", 20);
    f.addTable("c", 30);
    f.saveProject({"a", "b", "c"});

    {
      auto state = f.fullState();
      state->begin("p", buildWorkList(f.projects->load("p")), true);
      state->record("p", "sbnmaster", "a",
                    TableTransition::to(TableStatus::IN_PROGRESS));
      TableTransition done = TableTransition::to(TableStatus::COMPLETED);
      done.rowsTransferred = 10;
      state->record("p", "sbnmaster", "a", done);
      state->record("p", "sbnmaster", "b",
                    TableTransition::to(TableStatus::IN_PROGRESS));
    }

    ScriptedDecisions decisions;
    TransferReport report = f.engine()->runFull("p", decisions);

    runner.assertEquals(1, decisions.incompleteRunCalls, "Resume offered");
    runner.assertEquals("b", decisions.probeTable, "b is the probe");
    runner.assertEquals("b,c", joined(f.loadOrder()), "Work list is [b, c]");
    runner.assertEquals(3, static_cast<int64_t>(report.completed),
                        "All three completed");
    runner.assertEquals(60, report.totalRows,
                        "Rows of earlier run are counted");
  });

  runner.runTest("Restart discards previous progress", [&]() {
    Fixture f;
    f.addTable("a", 10);
    f.addTable("b", 20);
    f.saveProject({"a", "b"});
    {
      auto state = f.fullState();
      state->record("p", "sbnmaster", "a",
                    TableTransition::to(TableStatus::IN_PROGRESS));
      state->record("p", "sbnmaster", "a",
                    TableTransition::to(TableStatus::COMPLETED));
      state->record("p", "sbnmaster", "b",
                    TableTransition::to(TableStatus::IN_PROGRESS));
    }

    ScriptedDecisions decisions;
    decisions.resume = ResumeDecision::RESTART;
    TransferReport report = f.engine()->runFull("p", decisions);
    runner.assertEquals("a,b", joined(f.loadOrder()), "Both tables rerun");
    runner.assertTrue(report.success, "Run succeeded");
  });

  runner.runTest("A completed run is not offered for resume", [&]() {
    Fixture f;
    f.addTable("a", 10);
    f.addTable("b", 20);
    f.saveProject({"a", "b"});
    auto engine = f.engine();

    ScriptedDecisions first;
    runner.assertTrue(engine->runFull("p", first).success, "First run");
    ScriptedDecisions second;
    TransferReport report = engine->runFull("p", second);
    runner.assertEquals(0, second.incompleteRunCalls, "No resume prompt");
    runner.assertEquals(2, static_cast<int64_t>(report.completed),
                        "Tables transferred again");
    runner.assertEquals(30, f.destination->rowCount("sbnmaster", "a") +
                                f.destination->rowCount("sbnmaster", "b"),
                        "TRUNCATE keeps destination equal to source");
  });

  runner.runTest("Probe mismatch: skip, then the run continues", [&]() {
    Fixture f;
    f.addTable("users", 3500);
    f.addTable("branches", 100);
    f.destination->dropRowsOnNextLoad("sbnmaster", "users", 2);
    f.saveProject({"users", "branches"});

    ScriptedDecisions decisions;
    decisions.mismatchAnswers = {MismatchDecision::SKIP};
    TransferReport report = f.engine()->runFull("p", decisions);

    runner.assertEquals("users", joined(decisions.mismatchTables),
                        "Asked about users");
    runner.assertEquals(2, decisions.discrepancies.empty()
                               ? -1
                               : decisions.discrepancies[0],
                        "Discrepancy 2");
    const TableReport *users = findRow(report, "users");
    runner.assertTrue(users && users->status == TableStatus::SKIPPED,
                      "users skipped");
    runner.assertContains(users ? users->reason : "", "discrepancy 2",
                          "Reason records the discrepancy");
    const TableReport *branches = findRow(report, "branches");
    runner.assertTrue(branches && branches->status == TableStatus::COMPLETED,
                      "branches completed after the decision");
    runner.assertTrue(report.finalPhase == CoordinatorPhase::COMPLETED,
                      "Run completed");
  });

  runner.runTest("Parallel mismatch: skip resumes dispatch", [&]() {
    Fixture f;
    std::vector<std::string> tables = {"t0", "t1", "t2", "t3", "t4", "t5"};
    for (const auto &t : tables)
      f.addTable(t, 300);
    f.destination->alwaysDropRows("sbnmaster", "t2", 5);
    f.saveProject(tables, TransferMode::TRUNCATE, 2);

    ScriptedDecisions decisions;
    decisions.mismatchAnswers = {MismatchDecision::SKIP};
    TransferReport report = f.engine()->runFull("p", decisions);

    runner.assertEquals("t2", joined(decisions.mismatchTables),
                        "One mismatch decision");
    runner.assertEquals(5, static_cast<int64_t>(report.completed),
                        "Every other table completed");
    runner.assertEquals(1, static_cast<int64_t>(report.skipped),
                        "t2 skipped");
    runner.assertEquals(0, static_cast<int64_t>(report.pending),
                        "Nothing left pending");
    runner.assertEquals(1500, report.totalRows,
                        "Skipped table rows not counted");
  });

  runner.runTest("Parallel mismatch: retry re-runs the table", [&]() {
    Fixture f;
    std::vector<std::string> tables = {"t0", "t1", "t2", "t3"};
    for (const auto &t : tables)
      f.addTable(t, 200);
    f.destination->dropRowsOnNextLoad("sbnmaster", "t1", 3);
    f.saveProject(tables, TransferMode::TRUNCATE, 2);

    ScriptedDecisions decisions;
    decisions.mismatchAnswers = {MismatchDecision::RETRY};
    TransferReport report = f.engine()->runFull("p", decisions);

    runner.assertEquals("t1", joined(decisions.mismatchTables),
                        "Asked once");
    runner.assertEquals(4, static_cast<int64_t>(report.completed),
                        "Retry fixed t1");
    runner.assertEquals(200, f.destination->rowCount("sbnmaster", "t1"),
                        "Retry truncated and reloaded");
    runner.assertTrue(report.success, "Run succeeded");
  });

  runner.runTest("Parallel mismatch: abort stops dispatch", [&]() {
    Fixture f;
    std::vector<std::string> tables = {"a", "b", "c", "d"};
    for (const auto &t : tables)
      f.addTable(t, 50);
    f.destination->alwaysDropRows("sbnmaster", "b", 1);
    f.saveProject(tables, TransferMode::TRUNCATE, 1);

    ScriptedDecisions decisions;
    decisions.mismatchAnswers = {MismatchDecision::ABORT};
    TransferReport report = f.engine()->runFull("p", decisions);

    runner.assertEquals("a,b", joined(f.loadOrder()),
                        "Nothing dispatched after abort");
    runner.assertTrue(report.finalPhase == CoordinatorPhase::ABORTED,
                      "Aborted");
    runner.assertFalse(report.success, "Not a success");
    runner.assertEquals(1, static_cast<int64_t>(report.mismatch),
                        "b left as mismatch");
    runner.assertEquals(2, static_cast<int64_t>(report.pending),
                        "c and d pending");
    const TableReport *c = findRow(report, "c");
    runner.assertEquals("not run", c ? c->reason : "", "Pending reason");
  });

  runner.runTest("Declining after the probe keeps state for resume", [&]() {
    Fixture f;
    f.addTable("a", 10);
    f.addTable("b", 20);
    f.addTable("c", 30);
    f.saveProject({"a", "b", "c"});
    auto engine = f.engine();

    ScriptedDecisions decline;
    decline.continueAfterProbe = false;
    TransferReport first = engine->runFull("p", decline);
    runner.assertTrue(first.finalPhase == CoordinatorPhase::ABORTED,
                      "Declined run is aborted");
    runner.assertEquals("a", joined(f.loadOrder()), "Only the probe ran");
    runner.assertEquals(2, static_cast<int64_t>(first.pending),
                        "Two tables pending");

    ScriptedDecisions resume;
    TransferReport second = engine->runFull("p", resume);
    runner.assertEquals(1, resume.incompleteRunCalls, "Resume offered");
    runner.assertEquals("a,b,c", joined(f.loadOrder()),
                        "Resumed with b and c");
    runner.assertTrue(second.success, "Second run succeeded");
  });

  runner.runTest("At most N tables in progress after the probe", [&]() {
    Fixture f;
    std::vector<std::string> tables;
    for (int i = 0; i < 8; ++i) {
      tables.push_back("t" + std::to_string(i));
      f.addTable(tables.back(), 500);
    }
    f.destination->setLoadDelay(std::chrono::milliseconds(10));
    TransferProject project = makeProject("p", tables, TransferMode::TRUNCATE, 3);
    project.options.batchSize = 100;
    f.projects->save(project);

    auto state = f.fullState();
    ScriptedDecisions decisions;
    TransferCoordinator coordinator(f.projects, state, f.factory, f.bcp,
                                    decisions, f.dir.path());

    std::atomic<bool> done{false};
    std::atomic<int> maxInProgress{0};
    std::thread sampler([&]() {
      while (!done.load()) {
        int count = static_cast<int>(
            state->snapshot("p").countWithStatus(TableStatus::IN_PROGRESS));
        if (count > maxInProgress.load())
          maxInProgress.store(count);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    });

    TransferReport report = coordinator.run("p", TransferPhase::FULL);
    done.store(true);
    sampler.join();

    runner.assertTrue(maxInProgress.load() <= 3,
                      "Sampled in_progress count exceeded 3: " +
                          std::to_string(maxInProgress.load()));
    runner.assertTrue(f.destination->maxConcurrentLoads() <= 3,
                      "More than 3 tables loading at once");
    runner.assertTrue(f.destination->maxConcurrentLoads() >= 2,
                      "Parallel phase did run tables side by side");
    runner.assertEquals(8, static_cast<int64_t>(report.completed),
                        "All tables completed");
    runner.assertTrue(coordinator.phase() == CoordinatorPhase::COMPLETED,
                      "Coordinator ends Completed");
  });

  runner.runTest("Stop request drains running tables and ends Aborted",
                 [&]() {
                   Fixture f;
                   std::vector<std::string> tables = {"a", "b", "c", "d"};
                   for (const auto &t : tables)
                     f.addTable(t, 40);
                   f.saveProject(tables, TransferMode::TRUNCATE, 1);

                   auto engine = f.engine();
                   engine->setStopPredicate([&f]() {
                     return f.destination->loadOrder().size() >= 2;
                   });
                   ScriptedDecisions decisions;
                   TransferReport report = engine->runFull("p", decisions);

                   runner.assertEquals("a,b", joined(f.loadOrder()),
                                       "No dispatch after the stop");
                   runner.assertTrue(report.finalPhase ==
                                         CoordinatorPhase::ABORTED,
                                     "Aborted");
                   runner.assertEquals(2, static_cast<int64_t>(report.completed),
                                       "Running table finished and persisted");
                   runner.assertEquals(2, static_cast<int64_t>(report.pending),
                                       "Rest pending for resume");
                 });

  runner.runTest("requestStop during the confirmation dispatches nothing",
                 [&]() {
                   Fixture f;
                   f.addTable("a", 10);
                   f.addTable("b", 10);
                   f.addTable("c", 10);
                   f.saveProject({"a", "b", "c"});

                   auto engine = f.engine();
                   ScriptedDecisions decisions;
                   decisions.whileConfirming = [&engine]() {
                     engine->requestStop();
                   };
                   TransferReport report = engine->runFull("p", decisions);

                   runner.assertEquals("a", joined(f.loadOrder()),
                                       "Only the probe ran");
                   runner.assertTrue(report.finalPhase ==
                                         CoordinatorPhase::ABORTED,
                                     "Aborted");
                   runner.assertContains(report.message, "Stopped on request",
                                         "Stop message");
                   runner.assertEquals(2, static_cast<int64_t>(report.pending),
                                       "Remaining tables left for resume");

                   ScriptedDecisions resume;
                   TransferReport second = engine->runFull("p", resume);
                   runner.assertTrue(second.success,
                                     "Next run is not stopped by the old request");
                 });

  runner.runTest("Failed table is reported, others carry on", [&]() {
    Fixture f;
    f.addTable("a", 10);
    f.addTable("b", 10);
    f.addTable("c", 10);
    f.destination->failInserts("sbnmaster", "b");
    f.saveProject({"a", "b", "c"}, TransferMode::TRUNCATE, 2);

    ScriptedDecisions decisions;
    TransferReport report = f.engine()->runFull("p", decisions);
    runner.assertEquals(2, static_cast<int64_t>(report.completed),
                        "a and c completed");
    runner.assertEquals(1, static_cast<int64_t>(report.failed), "b failed");
    const TableReport *b = findRow(report, "b");
    runner.assertNotEmpty(b ? b->reason : "", "Failure has a reason");
    runner.assertFalse(report.success, "Failures make the run unsuccessful");
  });

  runner.runTest("Unknown project is fatal before any table", [&]() {
    Fixture f;
    f.addTable("a", 10);
    ScriptedDecisions decisions;
    TransferReport report = f.engine()->runFull("ghost", decisions);
    runner.assertFalse(report.success, "Failed report");
    runner.assertContains(report.message, "Configuration error",
                          "Message explains");
    runner.assertTrue(f.loadOrder().empty(), "No table touched");
  });

  runner.runTest("State write failure is fatal before any table", [&]() {
    Fixture f;
    f.addTable("a", 10);
    f.saveProject({"a"});
    std::string blocker =
        f.dir.file("settings.json") + ".tmp." + std::to_string(::getpid());
    std::filesystem::create_directories(blocker);

    ScriptedDecisions decisions;
    TransferReport report = f.engine()->runFull("p", decisions);
    std::filesystem::remove_all(blocker);

    runner.assertFalse(report.success, "Failed report");
    runner.assertContains(report.message, "State could not be saved",
                          "Message explains");
    runner.assertTrue(f.loadOrder().empty(), "No table touched");
  });

  runner.runTest("A throwing decision hook ends the run with a report",
                 [&]() {
    Fixture f;
    f.addTable("a", 10);
    f.addTable("b", 20);
    f.saveProject({"a", "b"});

    ScriptedDecisions decisions;
    decisions.whileConfirming = []() {
      throw std::runtime_error("console input closed");
    };
    TransferReport report;
    bool escaped = false;
    try {
      report = f.engine()->runFull("p", decisions);
    } catch (const std::exception &) {
      escaped = true;
    }
    runner.assertFalse(escaped, "Nothing thrown to the caller");
    runner.assertFalse(report.success, "Failed report");
    runner.assertTrue(report.finalPhase == CoordinatorPhase::ABORTED,
                      "Ends Aborted");
    runner.assertContains(report.message, "console input closed",
                          "Message carries the cause");
    runner.assertEquals("a", joined(f.loadOrder()),
                        "Only the probe table ran");
  });

  runner.runTest("Extract-only and insert-only keep separate state", [&]() {
    Fixture f;
    f.addTable("a", 25, 3);
    f.addTable("b", 35, 3);
    f.saveProject({"a", "b"});
    auto engine = f.engine();

    ScriptedDecisions insertFirst;
    TransferReport early = engine->runInsertOnly("p", insertFirst);
    runner.assertEquals(2, static_cast<int64_t>(early.failed),
                        "Insert before extract fails every table");

    ScriptedDecisions extract;
    TransferReport extracted = engine->runExtractOnly("p", extract);
    runner.assertTrue(extracted.success, "Extract succeeded");
    runner.assertEquals(3, f.destination->rowCount("sbnmaster", "a"),
                        "Extract leaves the destination alone");

    ScriptedDecisions insert;
    insert.resume = ResumeDecision::RESTART;
    TransferReport inserted = engine->runInsertOnly("p", insert);
    runner.assertEquals(1, insert.incompleteRunCalls,
                        "Failed insert run is offered for resume");
    runner.assertTrue(inserted.success, "Insert succeeded");
    runner.assertEquals(25, f.destination->rowCount("sbnmaster", "a"),
                        "a loaded from staged data");
    runner.assertTrue(engine->status("p", TransferPhase::FULL).empty(),
                      "Full transfer state untouched");

    engine->resetState("p");
    runner.assertTrue(engine->status("p", TransferPhase::EXTRACT).empty(),
                      "Reset clears extract state");
    runner.assertTrue(engine->status("p", TransferPhase::INSERT).empty(),
                      "Reset clears insert state");
  });

  Logger::shutdown();
  runner.printSummary();
  return 0;
}
