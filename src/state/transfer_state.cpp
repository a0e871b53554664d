#include "state/transfer_state.h"
#include "utils/string_utils.h"
#include <stdexcept>

using json = nlohmann::ordered_json;

std::string statusToString(TableStatus status) {
  switch (status) {
  case TableStatus::PENDING:
    return "pending";
  case TableStatus::IN_PROGRESS:
    return "in_progress";
  case TableStatus::COMPLETED:
    return "completed";
  case TableStatus::MISMATCH:
    return "mismatch";
  case TableStatus::FAILED:
    return "failed";
  case TableStatus::SKIPPED:
    return "skipped";
  default:
    return "unknown";
  }
}

TableStatus parseStatus(const std::string &value) {
  std::string lower = StringUtils::toLower(StringUtils::trim(value));
  if (lower == "pending")
    return TableStatus::PENDING;
  if (lower == "in_progress")
    return TableStatus::IN_PROGRESS;
  if (lower == "completed")
    return TableStatus::COMPLETED;
  if (lower == "mismatch")
    return TableStatus::MISMATCH;
  if (lower == "failed")
    return TableStatus::FAILED;
  if (lower == "skipped")
    return TableStatus::SKIPPED;
  throw std::invalid_argument("Unknown table status: " + value);
}

bool isValidTransition(TableStatus from, TableStatus to) {
  switch (to) {
  case TableStatus::IN_PROGRESS:
    return from != TableStatus::COMPLETED;
  case TableStatus::COMPLETED:
  case TableStatus::MISMATCH:
  case TableStatus::FAILED:
    return from == TableStatus::IN_PROGRESS;
  case TableStatus::SKIPPED:
    return from == TableStatus::IN_PROGRESS || from == TableStatus::MISMATCH;
  case TableStatus::PENDING:
  default:
    return false;
  }
}

const TableTransferState *
ProjectTransferState::find(const std::string &database,
                           const std::string &table) const {
  for (const auto &entry : tables) {
    if (entry.database == database && entry.table == table)
      return &entry;
  }
  return nullptr;
}

TableStatus ProjectTransferState::statusOf(const std::string &database,
                                           const std::string &table) const {
  const TableTransferState *entry = find(database, table);
  return entry ? entry->status : TableStatus::PENDING;
}

bool ProjectTransferState::hasIncompleteWork() const {
  for (const auto &entry : tables) {
    if (entry.status != TableStatus::COMPLETED)
      return true;
  }
  return false;
}

size_t ProjectTransferState::countWithStatus(TableStatus status) const {
  size_t count = 0;
  for (const auto &entry : tables) {
    if (entry.status == status)
      ++count;
  }
  return count;
}

json ProjectTransferState::toJson() const {
  json node;
  node["STARTED_AT"] = startedAt;
  node["LAST_UPDATE"] = lastUpdate;
  json entries = json::object();
  for (const auto &entry : tables) {
    json item;
    item["status"] = statusToString(entry.status);
    item["source_rows"] = entry.sourceRows;
    item["dest_rows"] = entry.destRows;
    item["dest_rows_before"] = entry.destRowsBefore;
    item["rows_transferred"] = entry.rowsTransferred;
    item["discrepancy"] = entry.discrepancy;
    item["elapsed"] = entry.elapsedSeconds;
    if (!entry.error.empty())
      item["error"] = entry.error;
    entries[entry.key()] = item;
  }
  node["TABLES"] = entries;
  return node;
}

ProjectTransferState ProjectTransferState::fromJson(const json &node) {
  if (!node.is_object()) {
    throw std::invalid_argument("transfer state must be a JSON object");
  }

  ProjectTransferState state;
  if (node.contains("STARTED_AT") && node["STARTED_AT"].is_string())
    state.startedAt = node["STARTED_AT"].get<std::string>();
  if (node.contains("LAST_UPDATE") && node["LAST_UPDATE"].is_string())
    state.lastUpdate = node["LAST_UPDATE"].get<std::string>();

  if (!node.contains("TABLES"))
    return state;
  const json &entries = node["TABLES"];
  if (!entries.is_object()) {
    throw std::invalid_argument("TABLES must be a JSON object");
  }

  auto readInt = [](const json &item, const char *key) -> int64_t {
    return item.contains(key) && item[key].is_number()
               ? item[key].get<int64_t>()
               : 0;
  };

  for (auto it = entries.begin(); it != entries.end(); ++it) {
    const std::string &key = it.key();
    size_t sep = key.find("..");
    if (sep == std::string::npos || sep == 0 || sep + 2 >= key.size()) {
      throw std::invalid_argument("malformed table key '" + key +
                                  "' (expected <db>..<table>)");
    }
    const json &item = it.value();
    if (!item.is_object() || !item.contains("status") ||
        !item["status"].is_string()) {
      throw std::invalid_argument("table entry '" + key + "' has no status");
    }

    TableTransferState entry;
    entry.database = key.substr(0, sep);
    entry.table = key.substr(sep + 2);
    entry.status = parseStatus(item["status"].get<std::string>());
    entry.sourceRows = readInt(item, "source_rows");
    entry.destRows = readInt(item, "dest_rows");
    entry.destRowsBefore = readInt(item, "dest_rows_before");
    entry.rowsTransferred = readInt(item, "rows_transferred");
    entry.discrepancy = readInt(item, "discrepancy");
    if (item.contains("elapsed") && item["elapsed"].is_number())
      entry.elapsedSeconds = item["elapsed"].get<double>();
    if (item.contains("error") && item["error"].is_string())
      entry.error = item["error"].get<std::string>();
    state.tables.push_back(entry);
  }
  return state;
}
