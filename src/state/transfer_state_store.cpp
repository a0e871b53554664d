#include "state/transfer_state_store.h"
#include "core/logger.h"
#include "core/transfer_errors.h"
#include "utils/time_utils.h"
#include <stdexcept>

TransferStateStore::TransferStateStore(std::shared_ptr<ProjectStore> projects,
                                       std::string stateKey)
    : projects_(std::move(projects)), stateKey_(std::move(stateKey)) {
  if (!projects_) {
    throw std::invalid_argument("TransferStateStore requires a ProjectStore");
  }
}

TransferStateStore::ProjectSlot &
TransferStateStore::slotFor(const std::string &project) {
  std::lock_guard<std::mutex> lock(slotsMutex_);
  auto &slot = slots_[project];
  if (!slot) {
    slot = std::make_unique<ProjectSlot>();
  }
  return *slot;
}

void TransferStateStore::ensureLoadedUnlocked(const std::string &project,
                                              ProjectSlot &slot) {
  if (slot.loaded)
    return;

  auto section = projects_->readSection(project, stateKey_);
  ProjectTransferState state;
  if (section) {
    try {
      state = ProjectTransferState::fromJson(*section);
    } catch (const std::invalid_argument &e) {
      throw ConfigurationError("Project '" + project + "': " + stateKey_ +
                               " is corrupt: " + e.what());
    }
  }
  slot.state = std::move(state);
  slot.loaded = true;
}

void TransferStateStore::persistUnlocked(const std::string &project,
                                         const ProjectTransferState &state) {
  projects_->writeSection(project, stateKey_, state.toJson());
}

TransferStateStore::LoadResult
TransferStateStore::load(const std::string &project) {
  ProjectSlot &slot = slotFor(project);
  std::lock_guard<std::mutex> lock(slot.mutex);
  slot.loaded = false;
  ensureLoadedUnlocked(project, slot);

  LoadResult result;
  result.state = slot.state;
  result.hasIncompleteWork = slot.state.hasIncompleteWork();
  return result;
}

TableTransferState TransferStateStore::record(const std::string &project,
                                              const std::string &database,
                                              const std::string &table,
                                              const TableTransition &transition) {
  ProjectSlot &slot = slotFor(project);
  std::lock_guard<std::mutex> lock(slot.mutex);
  ensureLoadedUnlocked(project, slot);

  ProjectTransferState next = slot.state;
  TableTransferState *entry = nullptr;
  for (auto &candidate : next.tables) {
    if (candidate.database == database && candidate.table == table) {
      entry = &candidate;
      break;
    }
  }
  if (!entry) {
    TableTransferState fresh;
    fresh.database = database;
    fresh.table = table;
    next.tables.push_back(fresh);
    entry = &next.tables.back();
  }

  if (!isValidTransition(entry->status, transition.status)) {
    throw std::invalid_argument("Illegal transition for " + entry->key() +
                                ": " + statusToString(entry->status) + " -> " +
                                statusToString(transition.status));
  }

  if (transition.status == TableStatus::IN_PROGRESS) {
    entry->error.clear();
  }
  entry->status = transition.status;
  if (transition.sourceRows)
    entry->sourceRows = *transition.sourceRows;
  if (transition.destRows)
    entry->destRows = *transition.destRows;
  if (transition.destRowsBefore)
    entry->destRowsBefore = *transition.destRowsBefore;
  if (transition.rowsTransferred)
    entry->rowsTransferred = *transition.rowsTransferred;
  if (transition.discrepancy)
    entry->discrepancy = *transition.discrepancy;
  if (transition.elapsedSeconds)
    entry->elapsedSeconds = *transition.elapsedSeconds;
  if (transition.error)
    entry->error = *transition.error;

  std::string now = TimeUtils::getIsoTimestamp();
  if (next.startedAt.empty())
    next.startedAt = now;
  next.lastUpdate = now;

  TableTransferState updated = *entry;
  persistUnlocked(project, next);
  slot.state = std::move(next);

  Logger::debug(LogCategory::STATE, "TransferStateStore::record",
                project + " " + updated.key() + " -> " +
                    statusToString(updated.status));
  return updated;
}

void TransferStateStore::clear(const std::string &project) {
  ProjectSlot &slot = slotFor(project);
  std::lock_guard<std::mutex> lock(slot.mutex);
  projects_->removeSection(project, stateKey_);
  slot.state = ProjectTransferState();
  slot.loaded = true;
  Logger::info(LogCategory::STATE, "TransferStateStore::clear",
               "Cleared " + stateKey_ + " of project '" + project + "'");
}

void TransferStateStore::begin(const std::string &project,
                               const std::vector<TablePair> &pairs,
                               bool fresh) {
  ProjectSlot &slot = slotFor(project);
  std::lock_guard<std::mutex> lock(slot.mutex);
  ensureLoadedUnlocked(project, slot);

  ProjectTransferState next;
  std::string now = TimeUtils::getIsoTimestamp();
  if (!fresh) {
    next.startedAt = slot.state.startedAt;
  }
  if (next.startedAt.empty())
    next.startedAt = now;
  next.lastUpdate = now;

  // Entries of tables no longer in the mapping are dropped.
  for (const auto &pair : pairs) {
    const TableTransferState *existing =
        fresh ? nullptr : slot.state.find(pair.database, pair.table);
    if (existing) {
      next.tables.push_back(*existing);
    } else {
      TableTransferState entry;
      entry.database = pair.database;
      entry.table = pair.table;
      next.tables.push_back(entry);
    }
  }

  persistUnlocked(project, next);
  slot.state = std::move(next);
}

ProjectTransferState TransferStateStore::snapshot(const std::string &project) {
  ProjectSlot &slot = slotFor(project);
  std::lock_guard<std::mutex> lock(slot.mutex);
  ensureLoadedUnlocked(project, slot);
  return slot.state;
}
