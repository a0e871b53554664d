#include "core/transfer_defaults.h"
#include "core/transfer_errors.h"
#include "project/project_store.h"
#include "state/transfer_state_store.h"
#include "test_fixtures.h"
#include "test_runner.h"
#include <filesystem>
#include <iostream>
#include <thread>
#include <unistd.h>

using json = nlohmann::ordered_json;

namespace {

TableTransition finished(TableStatus status, int64_t rows) {
  TableTransition t = TableTransition::to(status);
  t.sourceRows = rows;
  t.destRows = rows;
  t.rowsTransferred = rows;
  return t;
}

// Blocks the store's temp file so the next whole-document write fails.
class WriteBlocker {
public:
  explicit WriteBlocker(const std::string &settingsPath)
      : path_(settingsPath + ".tmp." + std::to_string(::getpid())) {
    std::filesystem::create_directories(path_);
  }
  ~WriteBlocker() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

private:
  std::string path_;
};

} // namespace

int main() {
  TestRunner runner;
  initTestLogger("test_transfer_state_store.log");

  std::cout << "\n========================================" << std::endl;
  std::cout << "TRANSFER STATE STORE TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Never-run project has no state", [&]() {
    ScratchDirectory dir("state_store");
    auto projects = std::make_shared<ProjectStore>(dir.file("settings.json"));
    projects->save(makeProject("p1", {"users", "branches"}));
    TransferStateStore store(projects, TransferDefaults::FULL_STATE_KEY);

    TransferStateStore::LoadResult result = store.load("p1");
    runner.assertTrue(result.state.empty(), "State is empty");
    runner.assertFalse(result.hasIncompleteWork, "Nothing incomplete");
    runner.assertTrue(result.state.statusOf("sbnmaster", "users") ==
                          TableStatus::PENDING,
                      "Unknown table reads pending");
  });

  runner.runTest("Recorded transitions survive a new store instance", [&]() {
    ScratchDirectory dir("state_store");
    auto projects = std::make_shared<ProjectStore>(dir.file("settings.json"));
    projects->save(makeProject("p1", {"users", "branches"}));
    {
      TransferStateStore store(projects, TransferDefaults::FULL_STATE_KEY);
      store.begin("p1", buildWorkList(projects->load("p1")), true);
      store.record("p1", "sbnmaster", "users",
                   TableTransition::to(TableStatus::IN_PROGRESS));
      store.record("p1", "sbnmaster", "users",
                   finished(TableStatus::COMPLETED, 5000));
      store.record("p1", "sbnmaster", "branches",
                   TableTransition::to(TableStatus::IN_PROGRESS));
    }

    TransferStateStore reopened(projects, TransferDefaults::FULL_STATE_KEY);
    TransferStateStore::LoadResult result = reopened.load("p1");
    runner.assertTrue(result.hasIncompleteWork, "branches is incomplete");
    runner.assertEquals(2, static_cast<int64_t>(result.state.tables.size()),
                        "Two entries");
    const TableTransferState *users = result.state.find("sbnmaster", "users");
    runner.assertTrue(users && users->status == TableStatus::COMPLETED,
                      "users completed");
    runner.assertEquals(5000, users ? users->rowsTransferred : -1,
                        "users row count");
    runner.assertTrue(result.state.statusOf("sbnmaster", "branches") ==
                          TableStatus::IN_PROGRESS,
                      "branches in progress");
    runner.assertNotEmpty(result.state.startedAt, "Start time stamped");
    runner.assertNotEmpty(result.state.lastUpdate, "Update time stamped");

    json raw = *projects->readSection("p1", "TRANSFER_STATE");
    runner.assertEquals("completed",
                        raw["TABLES"]["sbnmaster..users"]["status"]
                            .get<std::string>(),
                        "Persisted under db..table key");
  });

  runner.runTest("Clear is idempotent and leaves everything pending", [&]() {
    ScratchDirectory dir("state_store");
    auto projects = std::make_shared<ProjectStore>(dir.file("settings.json"));
    projects->save(makeProject("p1", {"users", "branches"}));
    TransferStateStore store(projects, TransferDefaults::FULL_STATE_KEY);
    store.record("p1", "sbnmaster", "users",
                 TableTransition::to(TableStatus::IN_PROGRESS));

    store.clear("p1");
    store.clear("p1");

    TransferStateStore::LoadResult result = store.load("p1");
    runner.assertFalse(result.hasIncompleteWork, "No incomplete work");
    runner.assertTrue(result.state.statusOf("sbnmaster", "users") ==
                          TableStatus::PENDING,
                      "users pending");
    runner.assertTrue(result.state.statusOf("sbnmaster", "branches") ==
                          TableStatus::PENDING,
                      "branches pending");
    runner.assertFalse(projects->readSection("p1", "TRANSFER_STATE").has_value(),
                       "State key removed from the document");
  });

  runner.runTest("Illegal transitions are rejected", [&]() {
    ScratchDirectory dir("state_store");
    auto projects = std::make_shared<ProjectStore>(dir.file("settings.json"));
    projects->save(makeProject("p1", {"users"}));
    TransferStateStore store(projects, TransferDefaults::FULL_STATE_KEY);

    runner.assertThrows<std::invalid_argument>(
        [&]() {
          store.record("p1", "sbnmaster", "users",
                       finished(TableStatus::COMPLETED, 1));
        },
        "pending -> completed");

    store.record("p1", "sbnmaster", "users",
                 TableTransition::to(TableStatus::IN_PROGRESS));
    store.record("p1", "sbnmaster", "users",
                 finished(TableStatus::COMPLETED, 10));

    runner.assertThrows<std::invalid_argument>(
        [&]() {
          store.record("p1", "sbnmaster", "users",
                       TableTransition::to(TableStatus::IN_PROGRESS));
        },
        "completed -> in_progress");
    runner.assertThrows<std::invalid_argument>(
        [&]() {
          store.record("p1", "sbnmaster", "users",
                       TableTransition::to(TableStatus::PENDING));
        },
        "anything -> pending");
    runner.assertTrue(store.snapshot("p1").statusOf("sbnmaster", "users") ==
                          TableStatus::COMPLETED,
                      "Status unchanged after rejection");
  });

  runner.runTest("Mismatch may be skipped or retried", [&]() {
    runner.assertTrue(
        isValidTransition(TableStatus::MISMATCH, TableStatus::SKIPPED),
        "mismatch -> skipped");
    runner.assertTrue(
        isValidTransition(TableStatus::MISMATCH, TableStatus::IN_PROGRESS),
        "mismatch -> in_progress");
    runner.assertTrue(
        isValidTransition(TableStatus::FAILED, TableStatus::IN_PROGRESS),
        "failed -> in_progress");
    runner.assertFalse(
        isValidTransition(TableStatus::FAILED, TableStatus::SKIPPED),
        "failed -> skipped");
    runner.assertFalse(
        isValidTransition(TableStatus::SKIPPED, TableStatus::COMPLETED),
        "skipped -> completed");
  });

  runner.runTest("Failed write leaves file and memory unchanged", [&]() {
    ScratchDirectory dir("state_store");
    std::string settings = dir.file("settings.json");
    auto projects = std::make_shared<ProjectStore>(settings);
    projects->save(makeProject("p1", {"users"}));
    TransferStateStore store(projects, TransferDefaults::FULL_STATE_KEY);
    store.record("p1", "sbnmaster", "users",
                 TableTransition::to(TableStatus::IN_PROGRESS));

    {
      WriteBlocker blocker(settings);
      runner.assertThrows<PersistenceError>(
          [&]() {
            store.record("p1", "sbnmaster", "users",
                         finished(TableStatus::COMPLETED, 42));
          },
          "Write must fail");
    }

    runner.assertTrue(store.snapshot("p1").statusOf("sbnmaster", "users") ==
                          TableStatus::IN_PROGRESS,
                      "Cache not advanced");
    runner.assertTrue(store.load("p1").state.statusOf("sbnmaster", "users") ==
                          TableStatus::IN_PROGRESS,
                      "Disk not advanced");

    store.record("p1", "sbnmaster", "users",
                 finished(TableStatus::COMPLETED, 42));
    runner.assertTrue(store.load("p1").state.statusOf("sbnmaster", "users") ==
                          TableStatus::COMPLETED,
                      "Store usable once the disk recovers");
  });

  runner.runTest("Begin seeds the work list and drops unmapped tables", [&]() {
    ScratchDirectory dir("state_store");
    auto projects = std::make_shared<ProjectStore>(dir.file("settings.json"));
    projects->save(makeProject("p1", {"a", "b", "c"}));
    TransferStateStore store(projects, TransferDefaults::FULL_STATE_KEY);
    store.record("p1", "sbnmaster", "a",
                 TableTransition::to(TableStatus::IN_PROGRESS));
    store.record("p1", "sbnmaster", "a", finished(TableStatus::COMPLETED, 1));
    store.record("p1", "sbnmaster", "old",
                 TableTransition::to(TableStatus::IN_PROGRESS));
    std::string startedAt = store.snapshot("p1").startedAt;

    store.begin("p1", buildWorkList(projects->load("p1")), false);
    ProjectTransferState state = store.load("p1").state;
    runner.assertEquals(3, static_cast<int64_t>(state.tables.size()),
                        "Exactly the mapped tables");
    runner.assertEquals("a", state.tables[0].table, "Mapping order");
    runner.assertTrue(state.tables[0].status == TableStatus::COMPLETED,
                      "Existing entry kept on resume");
    runner.assertTrue(state.find("sbnmaster", "old") == nullptr,
                      "Unmapped entry dropped");
    runner.assertEquals(startedAt, state.startedAt, "Start time kept");

    store.begin("p1", buildWorkList(projects->load("p1")), true);
    state = store.load("p1").state;
    runner.assertTrue(state.tables[0].status == TableStatus::PENDING,
                      "Fresh begin resets entries");
    runner.assertEquals(3, static_cast<int64_t>(
                               state.countWithStatus(TableStatus::PENDING)),
                        "All pending");
  });

  runner.runTest("Concurrent records on one project are all kept", [&]() {
    ScratchDirectory dir("state_store");
    auto projects = std::make_shared<ProjectStore>(dir.file("settings.json"));
    std::vector<std::string> tables;
    for (int i = 0; i < 16; ++i)
      tables.push_back("t" + std::to_string(i));
    projects->save(makeProject("p1", tables));
    TransferStateStore store(projects, TransferDefaults::FULL_STATE_KEY);
    store.begin("p1", buildWorkList(projects->load("p1")), true);

    std::vector<std::thread> threads;
    for (int w = 0; w < 4; ++w) {
      threads.emplace_back([&store, &tables, w]() {
        for (size_t i = w; i < tables.size(); i += 4) {
          store.record("p1", "sbnmaster", tables[i],
                       TableTransition::to(TableStatus::IN_PROGRESS));
          store.record("p1", "sbnmaster", tables[i],
                       finished(TableStatus::COMPLETED,
                                static_cast<int64_t>(i)));
        }
      });
    }
    for (auto &t : threads)
      t.join();

    TransferStateStore reopened(projects, TransferDefaults::FULL_STATE_KEY);
    TransferStateStore::LoadResult result = reopened.load("p1");
    runner.assertFalse(result.hasIncompleteWork, "Every table completed");
    runner.assertEquals(16, static_cast<int64_t>(result.state.countWithStatus(
                                TableStatus::COMPLETED)),
                        "No lost update");
  });

  runner.runTest("Each phase keeps its own section", [&]() {
    ScratchDirectory dir("state_store");
    auto projects = std::make_shared<ProjectStore>(dir.file("settings.json"));
    projects->save(makeProject("p1", {"users"}));
    TransferStateStore extract(projects, TransferDefaults::EXTRACT_STATE_KEY);
    TransferStateStore insert(projects, TransferDefaults::INSERT_STATE_KEY);

    extract.record("p1", "sbnmaster", "users",
                   TableTransition::to(TableStatus::IN_PROGRESS));
    extract.record("p1", "sbnmaster", "users",
                   finished(TableStatus::COMPLETED, 3));

    runner.assertTrue(insert.load("p1").state.empty(),
                      "Insert phase untouched by extract");
    runner.assertTrue(projects->readSection("p1", "EXTRACT_STATE").has_value(),
                      "Extract section written");
  });

  runner.runTest("State written by earlier releases is readable", [&]() {
    ScratchDirectory dir("state_store");
    auto projects = std::make_shared<ProjectStore>(dir.file("settings.json"));
    projects->save(makeProject("p1", {"users", "branches"}));
    projects->writeSection("p1", "TRANSFER_STATE", json::parse(R"({
      "STARTED_AT": "2025-01-01T10:00:00",
      "LAST_UPDATE": "2025-01-01T10:05:00",
      "TABLES": {
        "sbnmaster..users": {"status": "completed", "source_rows": 5,
                             "dest_rows": 5, "verified": true,
                             "elapsed": "3s", "error": null},
        "sbnmaster..branches": {"status": "pending"}
      }
    })"));

    TransferStateStore store(projects, TransferDefaults::FULL_STATE_KEY);
    TransferStateStore::LoadResult result = store.load("p1");
    runner.assertTrue(result.hasIncompleteWork, "branches pending");
    runner.assertEquals(5, result.state.tables[0].destRows, "dest_rows read");
  });

  runner.runTest("Corrupt state is a configuration error", [&]() {
    ScratchDirectory dir("state_store");
    auto projects = std::make_shared<ProjectStore>(dir.file("settings.json"));
    projects->save(makeProject("p1", {"users"}));
    projects->writeSection("p1", "TRANSFER_STATE",
                           json::parse(R"({"TABLES": {"nodots": {}}})"));
    TransferStateStore store(projects, TransferDefaults::FULL_STATE_KEY);
    runner.assertThrows<ConfigurationError>([&]() { store.load("p1"); },
                                            "Malformed key");
  });

  Logger::shutdown();
  runner.printSummary();
  return 0;
}
