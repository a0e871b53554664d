#include "core/app_config.h"
#include "core/transfer_errors.h"
#include "mocks/fake_database.h"
#include "engines/database_discovery.h"
#include "engines/odbc_session.h"
#include "engines/sql_dialect.h"
#include "test_fixtures.h"
#include "test_runner.h"
#include <algorithm>
#include <iostream>

int main() {
  TestRunner runner;
  initTestLogger("test_sql_dialect.log");

  std::cout << "\n========================================" << std::endl;
  std::cout << "SQL DIALECT TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Identifier quoting per server", [&]() {
    runner.assertEquals("[users]", SqlDialect::quoteIdentifier(
                                       DatabasePlatform::MSSQL, "users"),
                        "MSSQL brackets");
    runner.assertEquals("[odd]]name]", SqlDialect::quoteIdentifier(
                                           DatabasePlatform::MSSQL, "odd]name"),
                        "Closing bracket doubled");
    runner.assertEquals("users", SqlDialect::quoteIdentifier(
                                     DatabasePlatform::SYBASE, "users"),
                        "SYBASE bare");
    runner.assertThrows<SchemaError>(
        []() {
          SqlDialect::quoteIdentifier(DatabasePlatform::SYBASE, "bad name");
        },
        "SYBASE rejects names needing quotes");
    runner.assertThrows<SchemaError>(
        []() { SqlDialect::quoteIdentifier(DatabasePlatform::MSSQL, ""); },
        "Empty identifier");
  });

  runner.runTest("Row count statements", [&]() {
    runner.assertEquals(
        "SELECT COUNT_BIG(*) FROM [sbnmaster]..[users]",
        SqlDialect::countRows(DatabasePlatform::MSSQL, "sbnmaster", "users"),
        "MSSQL");
    runner.assertEquals(
        "SELECT COUNT(*) FROM sbnmaster..users",
        SqlDialect::countRows(DatabasePlatform::SYBASE, "sbnmaster", "users"),
        "SYBASE");
  });

  runner.runTest("Literals", [&]() {
    ColumnInfo text{"name", "varchar", true};
    ColumnInfo blob{"data", "varbinary", true};
    runner.assertEquals("NULL",
                        SqlDialect::literal(DatabasePlatform::MSSQL, text,
                                            std::nullopt),
                        "NULL");
    runner.assertEquals("N'O''Brien'",
                        SqlDialect::literal(DatabasePlatform::MSSQL, text,
                                            std::string("O'Brien")),
                        "MSSQL unicode literal");
    runner.assertEquals("'O''Brien'",
                        SqlDialect::literal(DatabasePlatform::SYBASE, text,
                                            std::string("O'Brien")),
                        "SYBASE literal");
    runner.assertEquals("0xDEAD",
                        SqlDialect::literal(DatabasePlatform::MSSQL, blob,
                                            std::string("DEAD")),
                        "Binary as hex");
  });

  runner.runTest("Insert batching", [&]() {
    std::vector<ColumnInfo> columns = {{"id", "int", false}};
    std::vector<Row> rows;
    for (int i = 0; i < 2500; ++i)
      rows.push_back({std::to_string(i)});

    auto mssql = SqlDialect::buildInsertStatements(
        DatabasePlatform::MSSQL, "db", "t", columns, rows);
    runner.assertEquals(3, static_cast<int64_t>(mssql.size()),
                        "1000 rows per MSSQL statement");
    runner.assertContains(mssql[0], "INSERT INTO [db]..[t] ([id]) VALUES",
                          "MSSQL statement head");

    std::vector<Row> few(rows.begin(), rows.begin() + 3);
    auto sybase = SqlDialect::buildInsertStatements(
        DatabasePlatform::SYBASE, "db", "t", columns, few);
    runner.assertEquals(3, static_cast<int64_t>(sybase.size()),
                        "One SYBASE statement per row");
    runner.assertEquals("INSERT INTO db..t (id) VALUES ('0')", sybase[0],
                        "SYBASE statement");

    runner.assertThrows<QueryError>(
        [&]() {
          SqlDialect::buildInsertStatements(DatabasePlatform::MSSQL, "db", "t",
                                            columns,
                                            {{std::string("1"), std::string("2")}});
        },
        "Row width mismatch");
  });

  runner.runTest("ODBC connection string", [&]() {
    AppConfig::resetToDefaults();
    ConnectionDescriptor sybase;
    sybase.platform = DatabasePlatform::SYBASE;
    sybase.host = "ase01";
    sybase.username = "sa";
    sybase.password = "p;w";
    std::string conn = OdbcConnectionFactory::buildConnectionString(sybase);
    runner.assertContains(conn, "DRIVER={FreeTDS};", "Driver braced");
    runner.assertContains(conn, "PORT=5000;", "SYBASE default port");
    runner.assertContains(conn, "TDS_Version=5.0;", "ASE protocol version");
    runner.assertContains(conn, "PWD={p;w};", "Password with ';' braced");

    ConnectionDescriptor mssql;
    mssql.platform = DatabasePlatform::MSSQL;
    mssql.host = "sql01";
    mssql.port = 14330;
    mssql.username = "sa";
    mssql.password = "pw";
    conn = OdbcConnectionFactory::buildConnectionString(mssql);
    runner.assertContains(conn, "PORT=14330;", "Explicit port");
    runner.assertContains(conn, "TDS_Version=7.4;", "MSSQL protocol version");
  });

  runner.runTest("Discovery selects tables by pattern", [&]() {
    auto server = std::make_shared<FakeServer>();
    std::vector<ColumnInfo> columns = {{"id", "int", false}};
    for (const char *table : {"users", "user_roles", "branches", "tmp_users"})
      server->addTable("sbnmaster", table, columns, 0);
    server->addTable("audit", "events", columns, 0);
    auto factory = std::make_shared<FakeConnectionFactory>();
    factory->addServer("ase01", server);

    ConnectionDescriptor source;
    source.platform = DatabasePlatform::SYBASE;
    source.host = "ase01";

    DatabaseDiscovery discovery(factory);
    runner.assertEquals(2, static_cast<int64_t>(
                               discovery.listDatabases(source).size()),
                        "Two databases");
    runner.assertEquals(4, static_cast<int64_t>(
                               discovery.listTables(source, "sbnmaster").size()),
                        "Four tables");

    DatabaseDiscovery::TableSelection selection =
        discovery.selectTables(source, "sbnmaster", {"USER*"}, {"*_roles"});
    runner.assertEquals(1, static_cast<int64_t>(selection.selected.size()),
                        "Include then exclude");
    runner.assertEquals("users",
                        selection.selected.empty() ? "" : selection.selected[0],
                        "users selected");
    runner.assertEquals(3, static_cast<int64_t>(selection.excluded.size()),
                        "Every other table is listed as excluded");
    auto isExcluded = [&](const std::string &table) {
      return std::find(selection.excluded.begin(), selection.excluded.end(),
                       table) != selection.excluded.end();
    };
    runner.assertTrue(isExcluded("user_roles"), "Removed by exclude pattern");
    runner.assertTrue(isExcluded("branches"), "Never matched an include");
    runner.assertTrue(isExcluded("tmp_users"), "Never matched an include");

    server->setUnreachable(true);
    runner.assertThrows<ConnectionError>(
        [&]() { discovery.listTables(source, "sbnmaster"); },
        "Unreachable server");
  });

  Logger::shutdown();
  runner.printSummary();
  return 0;
}
