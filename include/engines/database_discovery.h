#ifndef DATABASE_DISCOVERY_H
#define DATABASE_DISCOVERY_H

#include "engines/database_session.h"
#include <memory>
#include <string>
#include <vector>

// Catalog browsing used when building a project's mappings. The transfer
// itself never discovers anything; it runs the mapping it is given.
class DatabaseDiscovery {
public:
  explicit DatabaseDiscovery(std::shared_ptr<IConnectionFactory> factory);

  std::vector<std::string> listDatabases(const ConnectionDescriptor &connection);
  std::vector<std::string> listTables(const ConnectionDescriptor &connection,
                                      const std::string &database);

  struct TableSelection {
    std::vector<std::string> selected;
    // Every listed table that was not selected, whether no include pattern
    // matched it or an exclude pattern removed it.
    std::vector<std::string> excluded;
  };

  TableSelection selectTables(const ConnectionDescriptor &connection,
                              const std::string &database,
                              const std::vector<std::string> &includePatterns,
                              const std::vector<std::string> &excludePatterns);

private:
  std::shared_ptr<IConnectionFactory> factory_;
};

#endif
