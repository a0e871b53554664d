#include "engines/database_discovery.h"
#include "core/logger.h"
#include "utils/pattern_matcher.h"
#include <algorithm>

DatabaseDiscovery::DatabaseDiscovery(std::shared_ptr<IConnectionFactory> factory)
    : factory_(std::move(factory)) {}

std::vector<std::string>
DatabaseDiscovery::listDatabases(const ConnectionDescriptor &connection) {
  auto session = factory_->connect(connection);
  return session->listDatabases();
}

std::vector<std::string>
DatabaseDiscovery::listTables(const ConnectionDescriptor &connection,
                              const std::string &database) {
  auto session = factory_->connect(connection);
  return session->listTables(database);
}

// Lists the tables of a database and splits them into the ones the patterns
// select and the rest, both in catalog order.
DatabaseDiscovery::TableSelection DatabaseDiscovery::selectTables(
    const ConnectionDescriptor &connection, const std::string &database,
    const std::vector<std::string> &includePatterns,
    const std::vector<std::string> &excludePatterns) {
  std::vector<std::string> all = listTables(connection, database);
  TableSelection selection;
  selection.selected =
      PatternMatcher::filter(all, includePatterns, excludePatterns);
  for (const auto &table : all) {
    if (std::find(selection.selected.begin(), selection.selected.end(),
                  table) == selection.selected.end()) {
      selection.excluded.push_back(table);
    }
  }
  Logger::info(LogCategory::DATABASE, "DatabaseDiscovery::selectTables",
               std::to_string(selection.selected.size()) + " of " +
                   std::to_string(all.size()) + " tables selected in " +
                   database);
  return selection;
}
