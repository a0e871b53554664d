#ifndef TRANSFER_STATE_STORE_H
#define TRANSFER_STATE_STORE_H

#include "project/project_store.h"
#include "project/transfer_project.h"
#include "state/transfer_state.h"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Single writer of per-table transfer state. Workers and the coordinator
// submit transitions here; nobody else edits the state section of a project.
//
// Operations on one project are serialised by that project's mutex, so the
// transitions of a table are totally ordered. The in-memory copy is only
// replaced after the whole document has been durably written; a
// PersistenceError leaves both the file and the cache at the previous state.
class TransferStateStore {
public:
  struct LoadResult {
    ProjectTransferState state;
    bool hasIncompleteWork = false;
  };

  // stateKey selects the section: TRANSFER_STATE, EXTRACT_STATE or
  // INSERT_STATE.
  TransferStateStore(std::shared_ptr<ProjectStore> projects,
                     std::string stateKey);

  TransferStateStore(const TransferStateStore &) = delete;
  TransferStateStore &operator=(const TransferStateStore &) = delete;

  // Re-reads the persisted section. Throws ConfigurationError if it is
  // malformed.
  LoadResult load(const std::string &project);

  // Throws std::invalid_argument for a transition the status graph does not
  // allow, PersistenceError if the write fails.
  TableTransferState record(const std::string &project,
                            const std::string &database,
                            const std::string &table,
                            const TableTransition &transition);

  // Removes the section; every table reads pending afterwards.
  void clear(const std::string &project);

  // Adds pending entries for the work list. fresh discards previous entries
  // and stamps a new start time.
  void begin(const std::string &project, const std::vector<TablePair> &pairs,
             bool fresh);

  ProjectTransferState snapshot(const std::string &project);

  const std::string &stateKey() const { return stateKey_; }

private:
  struct ProjectSlot {
    std::mutex mutex;
    bool loaded = false;
    ProjectTransferState state;
  };

  ProjectSlot &slotFor(const std::string &project);
  void ensureLoadedUnlocked(const std::string &project, ProjectSlot &slot);
  void persistUnlocked(const std::string &project,
                       const ProjectTransferState &state);

  std::shared_ptr<ProjectStore> projects_;
  std::string stateKey_;
  std::mutex slotsMutex_;
  std::unordered_map<std::string, std::unique_ptr<ProjectSlot>> slots_;
};

#endif
