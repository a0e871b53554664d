#include "engines/odbc_session.h"
#include "core/app_config.h"
#include "core/logger.h"
#include "core/transfer_defaults.h"
#include "core/transfer_errors.h"
#include "engines/sql_dialect.h"
#include "utils/string_utils.h"
#include <chrono>
#include <thread>

std::string odbcDiagnostics(SQLSMALLINT handleType, SQLHANDLE handle,
                            std::string *firstSqlState) {
  std::string message;
  if (handle == SQL_NULL_HANDLE)
    return "no diagnostic handle";

  SQLCHAR sqlState[6];
  SQLCHAR text[SQL_MAX_MESSAGE_LENGTH];
  SQLINTEGER nativeError = 0;
  SQLSMALLINT textLen = 0;
  for (SQLSMALLINT record = 1;; ++record) {
    SQLRETURN ret = SQLGetDiagRec(handleType, handle, record, sqlState,
                                  &nativeError, text, sizeof(text), &textLen);
    if (!SQL_SUCCEEDED(ret))
      break;
    std::string state(reinterpret_cast<char *>(sqlState));
    if (record == 1 && firstSqlState)
      *firstSqlState = state;
    if (!message.empty())
      message += "; ";
    message += "[" + state + "] " + std::string(reinterpret_cast<char *>(text));
  }
  return message.empty() ? "unknown ODBC error" : message;
}

void throwOdbcError(SQLSMALLINT handleType, SQLHANDLE handle,
                    const std::string &context) {
  std::string sqlState;
  std::string message = odbcDiagnostics(handleType, handle, &sqlState);
  if (StringUtils::startsWith(sqlState, "08") || sqlState == "HYT00" ||
      sqlState == "HYT01") {
    throw ConnectionError(context + ": " + message);
  }
  throw QueryError(context + ": " + message, sqlState);
}

ODBCConnection::ODBCConnection(const std::string &connectionString) {
  SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &env_);
  if (!SQL_SUCCEEDED(ret)) {
    lastError_ = "Failed to allocate environment handle";
    return;
  }

  ret = SQLSetEnvAttr(env_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3, 0);
  if (!SQL_SUCCEEDED(ret)) {
    lastError_ = "Failed to set ODBC version";
    release();
    return;
  }

  ret = SQLAllocHandle(SQL_HANDLE_DBC, env_, &dbc_);
  if (!SQL_SUCCEEDED(ret)) {
    lastError_ = "Failed to allocate connection handle";
    release();
    return;
  }

  SQLCHAR outConnStr[TransferDefaults::BUFFER_SIZE];
  SQLSMALLINT outConnStrLen;
  ret = SQLDriverConnect(dbc_, nullptr, (SQLCHAR *)connectionString.c_str(),
                         SQL_NTS, outConnStr, sizeof(outConnStr),
                         &outConnStrLen, SQL_DRIVER_NOPROMPT);
  if (!SQL_SUCCEEDED(ret)) {
    lastError_ = odbcDiagnostics(SQL_HANDLE_DBC, dbc_, &lastSqlState_);
    release();
    return;
  }

  valid_ = true;
}

void ODBCConnection::release() {
  if (dbc_ != SQL_NULL_HANDLE) {
    if (valid_)
      SQLDisconnect(dbc_);
    SQLFreeHandle(SQL_HANDLE_DBC, dbc_);
    dbc_ = SQL_NULL_HANDLE;
  }
  if (env_ != SQL_NULL_HANDLE) {
    SQLFreeHandle(SQL_HANDLE_ENV, env_);
    env_ = SQL_NULL_HANDLE;
  }
  valid_ = false;
}

ODBCConnection::~ODBCConnection() { release(); }

ODBCConnection::ODBCConnection(ODBCConnection &&other) noexcept
    : env_(other.env_), dbc_(other.dbc_), valid_(other.valid_),
      lastError_(std::move(other.lastError_)),
      lastSqlState_(std::move(other.lastSqlState_)) {
  other.env_ = SQL_NULL_HANDLE;
  other.dbc_ = SQL_NULL_HANDLE;
  other.valid_ = false;
}

ODBCConnection &ODBCConnection::operator=(ODBCConnection &&other) noexcept {
  if (this != &other) {
    release();
    env_ = other.env_;
    dbc_ = other.dbc_;
    valid_ = other.valid_;
    lastError_ = std::move(other.lastError_);
    lastSqlState_ = std::move(other.lastSqlState_);

    other.env_ = SQL_NULL_HANDLE;
    other.dbc_ = SQL_NULL_HANDLE;
    other.valid_ = false;
  }
  return *this;
}

ODBCStatement::ODBCStatement(SQLHDBC dbc) {
  SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, dbc, &stmt_);
  if (!SQL_SUCCEEDED(ret)) {
    stmt_ = SQL_NULL_HANDLE;
    throwOdbcError(SQL_HANDLE_DBC, dbc, "Failed to allocate statement handle");
  }
}

ODBCStatement::~ODBCStatement() {
  if (stmt_ != SQL_NULL_HANDLE) {
    SQLFreeHandle(SQL_HANDLE_STMT, stmt_);
  }
}

namespace {

// Reads one column of the current row. Long values arrive in
// BUFFER_SIZE - 1 byte chunks, each flagged SQL_SUCCESS_WITH_INFO.
std::optional<std::string> readColumn(SQLHSTMT stmt, SQLUSMALLINT column) {
  std::string value;
  char buffer[TransferDefaults::BUFFER_SIZE];
  constexpr SQLLEN CHUNK_SIZE = TransferDefaults::BUFFER_SIZE - 1;

  while (true) {
    SQLLEN len = 0;
    SQLRETURN ret =
        SQLGetData(stmt, column, SQL_C_CHAR, buffer, sizeof(buffer), &len);
    if (ret == SQL_NO_DATA)
      break;
    if (!SQL_SUCCEEDED(ret)) {
      throwOdbcError(SQL_HANDLE_STMT, stmt, "SQLGetData");
    }
    if (len == SQL_NULL_DATA)
      return std::nullopt;

    if (ret == SQL_SUCCESS_WITH_INFO &&
        (len == SQL_NO_TOTAL || len > CHUNK_SIZE)) {
      value.append(buffer, CHUNK_SIZE);
      continue;
    }
    value.append(buffer, static_cast<size_t>(len));
    break;
  }
  return value;
}

bool fetchRow(SQLHSTMT stmt, SQLSMALLINT numCols, Row &row) {
  SQLRETURN ret = SQLFetch(stmt);
  if (ret == SQL_NO_DATA)
    return false;
  if (!SQL_SUCCEEDED(ret)) {
    throwOdbcError(SQL_HANDLE_STMT, stmt, "SQLFetch");
  }
  row.clear();
  row.reserve(numCols);
  for (SQLSMALLINT i = 1; i <= numCols; ++i) {
    row.push_back(readColumn(stmt, static_cast<SQLUSMALLINT>(i)));
  }
  return true;
}

class OdbcRowReader : public IRowReader {
public:
  OdbcRowReader(std::unique_ptr<ODBCStatement> statement,
                std::vector<ColumnInfo> columns, SQLSMALLINT numCols)
      : statement_(std::move(statement)), columns_(std::move(columns)),
        numCols_(numCols) {}

  const std::vector<ColumnInfo> &columns() const override { return columns_; }

  size_t fetch(std::vector<Row> &out, size_t maxRows) override {
    if (exhausted_)
      return 0;
    size_t fetched = 0;
    Row row;
    while (fetched < maxRows) {
      if (!fetchRow(statement_->get(), numCols_, row)) {
        exhausted_ = true;
        break;
      }
      out.push_back(std::move(row));
      row = Row();
      ++fetched;
    }
    return fetched;
  }

private:
  std::unique_ptr<ODBCStatement> statement_;
  std::vector<ColumnInfo> columns_;
  SQLSMALLINT numCols_;
  bool exhausted_ = false;
};

std::string braceValue(const std::string &value) {
  if (value.find_first_of(";{}= ") == std::string::npos)
    return value;
  std::string escaped = "{";
  for (char c : value) {
    escaped += c;
    if (c == '}')
      escaped += '}';
  }
  return escaped + "}";
}

} // namespace

OdbcSession::OdbcSession(std::unique_ptr<ODBCConnection> connection,
                         DatabasePlatform platform, std::string label)
    : connection_(std::move(connection)), platform_(platform),
      label_(std::move(label)) {}

void OdbcSession::execDirect(SQLHSTMT stmt, const std::string &sql) {
  SQLRETURN ret = SQLExecDirect(stmt, (SQLCHAR *)sql.c_str(), SQL_NTS);
  if (ret == SQL_NO_DATA || SQL_SUCCEEDED(ret))
    return;
  throwOdbcError(SQL_HANDLE_STMT, stmt, label_ + " query failed");
}

void OdbcSession::useDatabase(const std::string &database) {
  if (database.empty() || database == currentDatabase_)
    return;
  ODBCStatement stmt(connection_->getDbc());
  execDirect(stmt.get(),
             "USE " + SqlDialect::quoteIdentifier(platform_, database));
  currentDatabase_ = database;
}

void OdbcSession::execute(const std::string &sql, const std::string &database) {
  useDatabase(database);
  ODBCStatement stmt(connection_->getDbc());
  execDirect(stmt.get(), sql);
}

std::vector<Row> OdbcSession::query(const std::string &sql,
                                    const std::string &database) {
  useDatabase(database);
  ODBCStatement stmt(connection_->getDbc());
  execDirect(stmt.get(), sql);

  std::vector<Row> rows;
  SQLSMALLINT numCols = 0;
  SQLRETURN ret = SQLNumResultCols(stmt.get(), &numCols);
  if (!SQL_SUCCEEDED(ret)) {
    throwOdbcError(SQL_HANDLE_STMT, stmt.get(), "SQLNumResultCols");
  }
  if (numCols <= 0)
    return rows;

  Row row;
  while (fetchRow(stmt.get(), numCols, row)) {
    rows.push_back(std::move(row));
    row = Row();
  }
  return rows;
}

int64_t OdbcSession::scalar(const std::string &sql) {
  std::vector<Row> rows = query(sql);
  if (rows.empty() || rows[0].empty() || !rows[0][0]) {
    throw QueryError(label_ + ": no value returned by: " + sql);
  }
  try {
    return std::stoll(*rows[0][0]);
  } catch (const std::exception &) {
    throw QueryError(label_ + ": non-numeric result '" + *rows[0][0] +
                     "' from: " + sql);
  }
}

int64_t OdbcSession::countRows(const std::string &database,
                               const std::string &table) {
  return scalar(SqlDialect::countRows(platform_, database, table));
}

bool OdbcSession::tableExists(const std::string &database,
                              const std::string &table) {
  if (scalar(SqlDialect::databaseExists(platform_, database)) == 0)
    return false;
  return scalar(SqlDialect::tableExists(platform_, database, table)) > 0;
}

std::vector<ColumnInfo> OdbcSession::getColumns(const std::string &database,
                                                const std::string &table) {
  std::vector<ColumnInfo> columns;
  for (const auto &row :
       query(SqlDialect::listColumns(platform_, database, table))) {
    if (row.size() < 3 || !row[0])
      continue;
    ColumnInfo column;
    column.name = *row[0];
    column.dataType = row[1] ? *row[1] : "";
    std::string nullable = row[2] ? StringUtils::toUpper(*row[2]) : "1";
    column.nullable = nullable == "YES" || nullable == "1";
    columns.push_back(column);
  }
  return columns;
}

void OdbcSession::truncateTable(const std::string &database,
                                const std::string &table) {
  execute(SqlDialect::truncateTable(platform_, database, table));
}

std::unique_ptr<IRowReader>
OdbcSession::openReader(const std::string &database, const std::string &table,
                        const std::vector<ColumnInfo> &columns) {
  auto stmt = std::make_unique<ODBCStatement>(connection_->getDbc());
  execDirect(stmt->get(),
             SqlDialect::selectColumns(platform_, database, table, columns));

  SQLSMALLINT numCols = 0;
  SQLRETURN ret = SQLNumResultCols(stmt->get(), &numCols);
  if (!SQL_SUCCEEDED(ret)) {
    throwOdbcError(SQL_HANDLE_STMT, stmt->get(), "SQLNumResultCols");
  }
  return std::make_unique<OdbcRowReader>(std::move(stmt), columns, numCols);
}

void OdbcSession::insertRows(const std::string &database,
                             const std::string &table,
                             const std::vector<ColumnInfo> &columns,
                             const std::vector<Row> &rows) {
  if (rows.empty())
    return;

  std::vector<std::string> statements =
      SqlDialect::buildInsertStatements(platform_, database, table, columns,
                                        rows);

  SQLHDBC dbc = connection_->getDbc();
  SQLRETURN ret = SQLSetConnectAttr(dbc, SQL_ATTR_AUTOCOMMIT,
                                    (SQLPOINTER)SQL_AUTOCOMMIT_OFF,
                                    SQL_IS_UINTEGER);
  if (!SQL_SUCCEEDED(ret)) {
    throwOdbcError(SQL_HANDLE_DBC, dbc, "Cannot begin transaction");
  }

  auto restoreAutocommit = [dbc]() {
    SQLSetConnectAttr(dbc, SQL_ATTR_AUTOCOMMIT, (SQLPOINTER)SQL_AUTOCOMMIT_ON,
                      SQL_IS_UINTEGER);
  };

  try {
    for (const auto &sql : statements) {
      ODBCStatement stmt(dbc);
      execDirect(stmt.get(), sql);
    }
    ret = SQLEndTran(SQL_HANDLE_DBC, dbc, SQL_COMMIT);
    if (!SQL_SUCCEEDED(ret)) {
      throwOdbcError(SQL_HANDLE_DBC, dbc, "Commit failed");
    }
  } catch (const TransferError &) {
    SQLEndTran(SQL_HANDLE_DBC, dbc, SQL_ROLLBACK);
    restoreAutocommit();
    throw;
  }
  restoreAutocommit();
}

std::vector<std::string> OdbcSession::listDatabases() {
  std::vector<std::string> names;
  for (const auto &row : query(SqlDialect::listDatabases(platform_))) {
    if (!row.empty() && row[0])
      names.push_back(StringUtils::trim(*row[0]));
  }
  return names;
}

std::vector<std::string> OdbcSession::listTables(const std::string &database) {
  std::vector<std::string> names;
  for (const auto &row : query(SqlDialect::listTables(platform_, database))) {
    if (!row.empty() && row[0])
      names.push_back(StringUtils::trim(*row[0]));
  }
  return names;
}

std::string
OdbcConnectionFactory::buildConnectionString(const ConnectionDescriptor &d) {
  std::string driver = AppConfig::getOdbcDriver();
  if (!StringUtils::startsWith(driver, "{"))
    driver = "{" + driver + "}";
  std::string tdsVersion = d.platform == DatabasePlatform::SYBASE
                               ? AppConfig::getSybaseTdsVersion()
                               : AppConfig::getMssqlTdsVersion();

  return "DRIVER=" + driver + ";SERVER=" + braceValue(d.host) +
         ";PORT=" + std::to_string(d.effectivePort()) +
         ";UID=" + braceValue(d.username) + ";PWD=" + braceValue(d.password) +
         ";TDS_Version=" + tdsVersion + ";ClientCharset=UTF-8;";
}

std::unique_ptr<IDatabaseSession>
OdbcConnectionFactory::connect(const ConnectionDescriptor &descriptor) {
  std::string connStr = buildConnectionString(descriptor);
  std::string label = platformToString(descriptor.platform) + "@" +
                      descriptor.host + ":" +
                      std::to_string(descriptor.effectivePort());

  std::string lastError;
  for (int attempt = 1; attempt <= TransferDefaults::CONNECT_MAX_RETRIES;
       ++attempt) {
    auto conn = std::make_unique<ODBCConnection>(connStr);
    if (conn->isValid()) {
      if (attempt > 1) {
        Logger::info(LogCategory::DATABASE, "OdbcConnectionFactory",
                     "Connected to " + label + " on attempt " +
                         std::to_string(attempt));
      }
      return std::make_unique<OdbcSession>(std::move(conn),
                                           descriptor.platform, label);
    }

    lastError = conn->lastError();
    // Wrong credentials do not get better with retries.
    if (conn->lastSqlState() == "28000")
      break;

    if (attempt < TransferDefaults::CONNECT_MAX_RETRIES) {
      int backoffMs =
          TransferDefaults::CONNECT_INITIAL_BACKOFF_MS * (1 << (attempt - 1));
      Logger::warning(LogCategory::DATABASE, "OdbcConnectionFactory",
                      "Connection attempt " + std::to_string(attempt) +
                          " to " + label + " failed, retrying in " +
                          std::to_string(backoffMs) + "ms...");
      std::this_thread::sleep_for(std::chrono::milliseconds(backoffMs));
    }
  }

  Logger::error(LogCategory::DATABASE, "OdbcConnectionFactory",
                "Cannot connect to " + label + ": " + lastError);
  throw ConnectionError("Cannot connect to " + label + ": " + lastError);
}
