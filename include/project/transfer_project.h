#ifndef TRANSFER_PROJECT_H
#define TRANSFER_PROJECT_H

#include "core/transfer_defaults.h"
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

enum class DatabasePlatform { MSSQL, SYBASE };

enum class TransferMode { APPEND, TRUNCATE };

enum class LoadMethod { INSERT, BCP };

struct ConnectionDescriptor {
  DatabasePlatform platform = DatabasePlatform::MSSQL;
  std::string host;
  int port = 0;
  std::string username;
  std::string password;

  // 0 means "not set": 1433 for MSSQL, 5000 for SYBASE.
  int effectivePort() const;
};

struct DatabaseMapping {
  std::string sourceDatabase;
  std::string destDatabase;
  std::vector<std::string> tables;
  std::vector<std::string> excludedTables;

  const std::string &destinationName() const {
    return destDatabase.empty() ? sourceDatabase : destDatabase;
  }
};

struct TransferOptions {
  TransferMode mode = TransferMode::TRUNCATE;
  size_t batchSize = TransferDefaults::DEFAULT_BATCH_SIZE;
  size_t threads = TransferDefaults::DEFAULT_THREADS;
  LoadMethod loadMethod = LoadMethod::INSERT;
};

struct TransferProject {
  std::string name;
  ConnectionDescriptor source;
  ConnectionDescriptor destination;
  std::vector<DatabaseMapping> databases;
  TransferOptions options;
};

// One unit of work: a source table and where it lands.
struct TablePair {
  std::string database;
  std::string destDatabase;
  std::string table;

  std::string key() const { return database + ".." + table; }
};

std::string platformToString(DatabasePlatform platform);
DatabasePlatform parsePlatform(const std::string &value);
std::string modeToString(TransferMode mode);
TransferMode parseMode(const std::string &value);
std::string loadMethodToString(LoadMethod method);
LoadMethod parseLoadMethod(const std::string &value);

// Configuration keys only; state sections are owned by TransferStateStore.
nlohmann::ordered_json projectToJson(const TransferProject &project);
TransferProject projectFromJson(const std::string &name,
                                const nlohmann::ordered_json &node);

// Throws ConfigurationError describing the first problem found.
void validateProject(const TransferProject &project);

// Databases in configuration order, tables in mapping order.
std::vector<TablePair> buildWorkList(const TransferProject &project);

#endif
