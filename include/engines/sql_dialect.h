#ifndef SQL_DIALECT_H
#define SQL_DIALECT_H

#include "engines/database_session.h"
#include "project/transfer_project.h"
#include <string>
#include <vector>

// SQL text for the two supported servers. MSSQL identifiers are bracketed;
// ASE identifiers are validated and emitted bare.
class SqlDialect {
public:
  static std::string quoteIdentifier(DatabasePlatform platform,
                                     const std::string &name);
  // db..table, resolved against the login's default schema/owner.
  static std::string qualifiedTable(DatabasePlatform platform,
                                    const std::string &database,
                                    const std::string &table);

  static std::string countRows(DatabasePlatform platform,
                               const std::string &database,
                               const std::string &table);
  static std::string databaseExists(DatabasePlatform platform,
                                    const std::string &database);
  static std::string tableExists(DatabasePlatform platform,
                                 const std::string &database,
                                 const std::string &table);
  // Result columns: name, type, nullable (1/0 or YES/NO).
  static std::string listColumns(DatabasePlatform platform,
                                 const std::string &database,
                                 const std::string &table);
  static std::string truncateTable(DatabasePlatform platform,
                                   const std::string &database,
                                   const std::string &table);
  static std::string selectColumns(DatabasePlatform platform,
                                   const std::string &database,
                                   const std::string &table,
                                   const std::vector<ColumnInfo> &columns);
  static std::string listDatabases(DatabasePlatform platform);
  static std::string listTables(DatabasePlatform platform,
                                const std::string &database);

  static std::string literal(DatabasePlatform platform,
                             const ColumnInfo &column,
                             const std::optional<std::string> &value);

  // MSSQL: multi-row VALUES lists of at most 1000 rows each.
  // SYBASE: one statement per row (ASE has no row constructors).
  static std::vector<std::string>
  buildInsertStatements(DatabasePlatform platform, const std::string &database,
                        const std::string &table,
                        const std::vector<ColumnInfo> &columns,
                        const std::vector<Row> &rows);

  static bool isBinaryType(const std::string &dataType);
};

#endif
