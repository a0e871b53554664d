#ifndef ODBC_SESSION_H
#define ODBC_SESSION_H

#include "engines/database_session.h"
#include <memory>
#include <sql.h>
#include <sqlext.h>
#include <string>

// Owns an ODBC environment and connection handle pair.
class ODBCConnection {
  SQLHENV env_{SQL_NULL_HANDLE};
  SQLHDBC dbc_{SQL_NULL_HANDLE};
  bool valid_{false};
  std::string lastError_;
  std::string lastSqlState_;

public:
  explicit ODBCConnection(const std::string &connectionString);
  ~ODBCConnection();

  ODBCConnection(const ODBCConnection &) = delete;
  ODBCConnection &operator=(const ODBCConnection &) = delete;

  ODBCConnection(ODBCConnection &&other) noexcept;
  ODBCConnection &operator=(ODBCConnection &&other) noexcept;

  SQLHDBC getDbc() const { return dbc_; }
  bool isValid() const { return valid_; }
  const std::string &lastError() const { return lastError_; }
  const std::string &lastSqlState() const { return lastSqlState_; }

private:
  void release();
};

// Statement handle scoped to one query.
class ODBCStatement {
  SQLHSTMT stmt_{SQL_NULL_HANDLE};

public:
  explicit ODBCStatement(SQLHDBC dbc);
  ~ODBCStatement();

  ODBCStatement(const ODBCStatement &) = delete;
  ODBCStatement &operator=(const ODBCStatement &) = delete;

  SQLHSTMT get() const { return stmt_; }
};

// Collects every diagnostic record on the handle into one message.
std::string odbcDiagnostics(SQLSMALLINT handleType, SQLHANDLE handle,
                            std::string *firstSqlState = nullptr);

// Throws ConnectionError for SQLSTATE class 08 (and the FreeTDS
// "communication link failure" states), QueryError otherwise.
[[noreturn]] void throwOdbcError(SQLSMALLINT handleType, SQLHANDLE handle,
                                 const std::string &context);

// Source and destination sessions through unixODBC and the FreeTDS driver,
// which speaks TDS 7.x to MSSQL and TDS 5.0 to ASE.
class OdbcSession : public IDatabaseSession {
public:
  OdbcSession(std::unique_ptr<ODBCConnection> connection,
              DatabasePlatform platform, std::string label);

  DatabasePlatform platform() const override { return platform_; }

  void execute(const std::string &sql,
               const std::string &database = "") override;
  std::vector<Row> query(const std::string &sql,
                         const std::string &database = "") override;
  int64_t countRows(const std::string &database,
                    const std::string &table) override;
  bool tableExists(const std::string &database,
                   const std::string &table) override;
  std::vector<ColumnInfo> getColumns(const std::string &database,
                                     const std::string &table) override;
  void truncateTable(const std::string &database,
                     const std::string &table) override;
  std::unique_ptr<IRowReader>
  openReader(const std::string &database, const std::string &table,
             const std::vector<ColumnInfo> &columns) override;
  void insertRows(const std::string &database, const std::string &table,
                  const std::vector<ColumnInfo> &columns,
                  const std::vector<Row> &rows) override;
  std::vector<std::string> listDatabases() override;
  std::vector<std::string> listTables(const std::string &database) override;

private:
  void useDatabase(const std::string &database);
  void execDirect(SQLHSTMT stmt, const std::string &sql);
  int64_t scalar(const std::string &sql);

  std::unique_ptr<ODBCConnection> connection_;
  DatabasePlatform platform_;
  std::string label_;
  std::string currentDatabase_;
};

class OdbcConnectionFactory : public IConnectionFactory {
public:
  std::unique_ptr<IDatabaseSession>
  connect(const ConnectionDescriptor &descriptor) override;

  // DRIVER=...;SERVER=...;PORT=...;UID=...;PWD=...;TDS_Version=...
  static std::string buildConnectionString(const ConnectionDescriptor &descriptor);
};

#endif
