#include "engines/sql_dialect.h"
#include "core/transfer_defaults.h"
#include "core/transfer_errors.h"
#include "utils/string_utils.h"
#include <algorithm>

std::string SqlDialect::quoteIdentifier(DatabasePlatform platform,
                                        const std::string &name) {
  if (name.empty()) {
    throw SchemaError("Identifier cannot be empty");
  }

  if (platform == DatabasePlatform::MSSQL) {
    std::string escaped = name;
    size_t pos = 0;
    while ((pos = escaped.find(']', pos)) != std::string::npos) {
      escaped.replace(pos, 1, "]]");
      pos += 2;
    }
    return "[" + escaped + "]";
  }

  if (!StringUtils::isValidDatabaseIdentifier(name)) {
    throw SchemaError("Identifier '" + name +
                      "' cannot be used unquoted on SYBASE");
  }
  return name;
}

std::string SqlDialect::qualifiedTable(DatabasePlatform platform,
                                       const std::string &database,
                                       const std::string &table) {
  return quoteIdentifier(platform, database) + ".." +
         quoteIdentifier(platform, table);
}

std::string SqlDialect::countRows(DatabasePlatform platform,
                                  const std::string &database,
                                  const std::string &table) {
  std::string fn =
      platform == DatabasePlatform::MSSQL ? "COUNT_BIG(*)" : "COUNT(*)";
  return "SELECT " + fn + " FROM " + qualifiedTable(platform, database, table);
}

std::string SqlDialect::databaseExists(DatabasePlatform platform,
                                       const std::string &database) {
  if (platform == DatabasePlatform::MSSQL) {
    return "SELECT COUNT(*) FROM sys.databases WHERE name = N'" +
           StringUtils::escapeSQL(database) + "'";
  }
  return "SELECT COUNT(*) FROM master..sysdatabases WHERE name = '" +
         StringUtils::escapeSQL(database) + "'";
}

std::string SqlDialect::tableExists(DatabasePlatform platform,
                                    const std::string &database,
                                    const std::string &table) {
  std::string db = quoteIdentifier(platform, database);
  if (platform == DatabasePlatform::MSSQL) {
    return "SELECT COUNT(*) FROM " + db + ".sys.tables WHERE name = N'" +
           StringUtils::escapeSQL(table) + "'";
  }
  return "SELECT COUNT(*) FROM " + db +
         "..sysobjects WHERE type = 'U' AND name = '" +
         StringUtils::escapeSQL(table) + "'";
}

std::string SqlDialect::listColumns(DatabasePlatform platform,
                                    const std::string &database,
                                    const std::string &table) {
  std::string db = quoteIdentifier(platform, database);
  if (platform == DatabasePlatform::MSSQL) {
    return "SELECT COLUMN_NAME, DATA_TYPE, IS_NULLABLE FROM " + db +
           ".INFORMATION_SCHEMA.COLUMNS WHERE TABLE_NAME = N'" +
           StringUtils::escapeSQL(table) + "' ORDER BY ORDINAL_POSITION";
  }
  return "SELECT c.name, t.name, CASE WHEN (c.status & 8) = 8 THEN 1 ELSE 0 "
         "END FROM " +
         db + "..syscolumns c, " + db + "..systypes t, " + db +
         "..sysobjects o WHERE o.name = '" + StringUtils::escapeSQL(table) +
         "' AND o.type = 'U' AND c.id = o.id AND c.usertype = t.usertype "
         "ORDER BY c.colid";
}

std::string SqlDialect::truncateTable(DatabasePlatform platform,
                                      const std::string &database,
                                      const std::string &table) {
  return "TRUNCATE TABLE " + qualifiedTable(platform, database, table);
}

std::string SqlDialect::selectColumns(DatabasePlatform platform,
                                      const std::string &database,
                                      const std::string &table,
                                      const std::vector<ColumnInfo> &columns) {
  std::string sql = "SELECT ";
  if (columns.empty()) {
    sql += "*";
  } else {
    for (size_t i = 0; i < columns.size(); ++i) {
      if (i > 0)
        sql += ", ";
      sql += quoteIdentifier(platform, columns[i].name);
    }
  }
  return sql + " FROM " + qualifiedTable(platform, database, table);
}

std::string SqlDialect::listDatabases(DatabasePlatform platform) {
  if (platform == DatabasePlatform::MSSQL) {
    return "SELECT name FROM sys.databases WHERE database_id > 4 ORDER BY name";
  }
  return "SELECT name FROM master..sysdatabases WHERE dbid > 4 ORDER BY name";
}

std::string SqlDialect::listTables(DatabasePlatform platform,
                                   const std::string &database) {
  std::string db = quoteIdentifier(platform, database);
  if (platform == DatabasePlatform::MSSQL) {
    return "SELECT name FROM " + db + ".sys.tables ORDER BY name";
  }
  return "SELECT name FROM " + db +
         "..sysobjects WHERE type = 'U' ORDER BY name";
}

bool SqlDialect::isBinaryType(const std::string &dataType) {
  std::string lower = StringUtils::toLower(dataType);
  return lower == "binary" || lower == "varbinary" || lower == "image" ||
         lower == "timestamp" || lower == "rowversion";
}

// SQL_C_CHAR delivers binary columns as hex digits without a prefix.
std::string SqlDialect::literal(DatabasePlatform platform,
                                const ColumnInfo &column,
                                const std::optional<std::string> &value) {
  if (!value)
    return "NULL";
  if (isBinaryType(column.dataType)) {
    return value->empty() ? "NULL" : "0x" + *value;
  }
  std::string quoted = "'" + StringUtils::escapeSQL(*value) + "'";
  return platform == DatabasePlatform::MSSQL ? "N" + quoted : quoted;
}

std::vector<std::string>
SqlDialect::buildInsertStatements(DatabasePlatform platform,
                                  const std::string &database,
                                  const std::string &table,
                                  const std::vector<ColumnInfo> &columns,
                                  const std::vector<Row> &rows) {
  std::vector<std::string> statements;
  if (rows.empty())
    return statements;

  std::string head = "INSERT INTO " +
                     qualifiedTable(platform, database, table) + " (";
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0)
      head += ", ";
    head += quoteIdentifier(platform, columns[i].name);
  }
  head += ") VALUES ";

  auto tuple = [&](const Row &row) {
    if (row.size() != columns.size()) {
      throw QueryError("Row has " + std::to_string(row.size()) +
                       " values, expected " + std::to_string(columns.size()));
    }
    std::string values = "(";
    for (size_t i = 0; i < row.size(); ++i) {
      if (i > 0)
        values += ", ";
      values += literal(platform, columns[i], row[i]);
    }
    return values + ")";
  };

  size_t rowsPerStatement = platform == DatabasePlatform::MSSQL
                                ? TransferDefaults::MSSQL_MAX_ROWS_PER_INSERT
                                : 1;

  for (size_t start = 0; start < rows.size(); start += rowsPerStatement) {
    size_t end = std::min(rows.size(), start + rowsPerStatement);
    std::string sql = head;
    for (size_t i = start; i < end; ++i) {
      if (i > start)
        sql += ", ";
      sql += tuple(rows[i]);
    }
    statements.push_back(std::move(sql));
  }
  return statements;
}
