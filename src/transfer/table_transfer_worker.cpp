#include "transfer/table_transfer_worker.h"
#include "core/logger.h"
#include "core/transfer_errors.h"
#include "transfer/staged_data.h"
#include "transfer/table_loader.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <chrono>
#include <filesystem>

std::string phaseToString(TransferPhase phase) {
  switch (phase) {
  case TransferPhase::FULL:
    return "full";
  case TransferPhase::EXTRACT:
    return "extract";
  case TransferPhase::INSERT:
    return "insert";
  default:
    return "unknown";
  }
}

TableTransition TableOutcome::toTransition() const {
  TableTransition t = TableTransition::to(status);
  t.sourceRows = sourceRows;
  t.destRows = destRowsAfter;
  t.destRowsBefore = destRowsBefore;
  t.rowsTransferred = rowsTransferred;
  t.discrepancy = discrepancy;
  t.elapsedSeconds = elapsedSeconds;
  t.error = error;
  return t;
}

TableTransferWorker::TableTransferWorker(
    std::shared_ptr<IConnectionFactory> factory,
    std::shared_ptr<IBulkCopyRunner> bulkCopy, TransferProject project,
    std::string dataDirectory)
    : factory_(std::move(factory)), bulkCopy_(std::move(bulkCopy)),
      project_(std::move(project)), dataDirectory_(std::move(dataDirectory)) {}

// Runs one table in the given phase and maps the result to an outcome.
// Schema problems become skipped and every other error becomes failed with
// the message as the reason. Logs the final status of the table.
TableOutcome TableTransferWorker::run(const TablePair &pair,
                                      TransferPhase phase,
                                      const ProgressCallback &onProgress) const {
  TableOutcome outcome;
  outcome.pair = pair;
  auto start = std::chrono::steady_clock::now();

  try {
    switch (phase) {
    case TransferPhase::EXTRACT:
      runExtract(pair, onProgress, outcome);
      break;
    case TransferPhase::INSERT:
      runInsert(pair, onProgress, outcome);
      break;
    case TransferPhase::FULL:
    default:
      runFull(pair, onProgress, outcome);
      break;
    }
  } catch (const SchemaError &e) {
    outcome.status = TableStatus::SKIPPED;
    outcome.error = e.what();
  } catch (const ConnectionError &e) {
    outcome.status = TableStatus::FAILED;
    outcome.error = std::string("connection error: ") + e.what();
  } catch (const QueryError &e) {
    outcome.status = TableStatus::FAILED;
    outcome.error = e.what();
  } catch (const std::exception &e) {
    outcome.status = TableStatus::FAILED;
    outcome.error = e.what();
  }

  outcome.elapsedSeconds = TimeUtils::secondsSince(start);

  switch (outcome.status) {
  case TableStatus::COMPLETED:
    Logger::info(LogCategory::TRANSFER, "TableTransferWorker",
                 pair.key() + " completed: " +
                     std::to_string(outcome.rowsTransferred) + " rows in " +
                     StringUtils::formatDuration(outcome.elapsedSeconds));
    break;
  case TableStatus::MISMATCH:
    Logger::warning(LogCategory::VALIDATION, "TableTransferWorker",
                    pair.key() + ": " + outcome.error);
    break;
  case TableStatus::SKIPPED:
    Logger::warning(LogCategory::TRANSFER, "TableTransferWorker",
                    pair.key() + " skipped: " + outcome.error);
    break;
  default:
    Logger::error(LogCategory::TRANSFER, "TableTransferWorker",
                  pair.key() + " failed: " + outcome.error);
    break;
  }
  return outcome;
}

// Throws SchemaError when the destination table is missing or lacks a source
// column. Column names compare case-insensitively.
std::vector<ColumnInfo> TableTransferWorker::checkDestination(
    IDatabaseSession &destination, const TablePair &pair,
    const std::vector<ColumnInfo> &sourceColumns) const {
  if (!destination.tableExists(pair.destDatabase, pair.table)) {
    throw SchemaError("destination table " + pair.destDatabase + ".." +
                      pair.table + " does not exist");
  }

  std::vector<ColumnInfo> destColumns =
      destination.getColumns(pair.destDatabase, pair.table);
  for (const auto &column : sourceColumns) {
    bool found = false;
    for (const auto &destColumn : destColumns) {
      if (StringUtils::equalsIgnoreCase(column.name, destColumn.name)) {
        found = true;
        break;
      }
    }
    if (!found) {
      throw SchemaError("column '" + column.name + "' is missing in " +
                        pair.destDatabase + ".." + pair.table);
    }
  }
  return destColumns;
}

// Empties the destination (TRUNCATE) or records its count (APPEND), streams
// the reader through the project's loader in batches and compares the
// destination count with the expected one. The loader must report every row
// it was given, otherwise the table fails.
void TableTransferWorker::loadAndVerify(
    IDatabaseSession &destination, IRowReader &reader, const TablePair &pair,
    const std::vector<ColumnInfo> &sourceColumns,
    const std::vector<ColumnInfo> &destinationColumns,
    const ProgressCallback &onProgress, TableOutcome &outcome) const {
  const TransferOptions &options = project_.options;

  if (options.mode == TransferMode::APPEND) {
    outcome.destRowsBefore =
        destination.countRows(pair.destDatabase, pair.table);
  } else {
    destination.truncateTable(pair.destDatabase, pair.table);
    Logger::debug(LogCategory::TRANSFER, "TableTransferWorker",
                  "Truncated " + pair.destDatabase + ".." + pair.table);
  }

  LoaderContext context;
  context.method = options.loadMethod;
  context.destination = &destination;
  context.bulkCopy = bulkCopy_.get();
  context.destinationConnection = project_.destination;
  context.database = pair.destDatabase;
  context.table = pair.table;
  context.sourceColumns = sourceColumns;
  context.destinationColumns = destinationColumns;
  context.spoolDirectory =
      StagingManifest::projectDirectory(dataDirectory_, project_.name);
  std::unique_ptr<ITableLoader> loader = createTableLoader(context);

  std::vector<Row> batch;
  batch.reserve(options.batchSize);
  int64_t rowsDone = 0;
  while (true) {
    batch.clear();
    size_t fetched = reader.fetch(batch, options.batchSize);
    if (fetched == 0)
      break;
    loader->writeBatch(batch);
    rowsDone += static_cast<int64_t>(fetched);
    if (onProgress)
      onProgress(rowsDone, outcome.sourceRows);
  }
  int64_t loaded = loader->finish();
  if (loaded != rowsDone) {
    throw QueryError(std::string(options.loadMethod == LoadMethod::BCP
                                     ? "bcp"
                                     : "loader") +
                     " reported " + std::to_string(loaded) + " of " +
                     std::to_string(rowsDone) + " rows loaded into " +
                     pair.destDatabase + ".." + pair.table);
  }
  outcome.rowsTransferred = rowsDone;

  outcome.destRowsAfter = destination.countRows(pair.destDatabase, pair.table);
  int64_t actual = options.mode == TransferMode::APPEND
                       ? outcome.destRowsAfter - outcome.destRowsBefore
                       : outcome.destRowsAfter;
  int64_t expected = outcome.sourceRows;

  if (actual == expected) {
    outcome.status = TableStatus::COMPLETED;
    outcome.discrepancy = 0;
  } else {
    outcome.status = TableStatus::MISMATCH;
    outcome.discrepancy = expected - actual;
    outcome.error = "row count mismatch: expected " + std::to_string(expected) +
                    ", destination " +
                    (options.mode == TransferMode::APPEND ? "gained "
                                                          : "has ") +
                    std::to_string(actual) + " (discrepancy " +
                    std::to_string(outcome.discrepancy) + ")";
  }
}

// Source to destination in one pass over two sessions.
void TableTransferWorker::runFull(const TablePair &pair,
                                  const ProgressCallback &onProgress,
                                  TableOutcome &outcome) const {
  std::unique_ptr<IDatabaseSession> source = factory_->connect(project_.source);
  std::unique_ptr<IDatabaseSession> destination =
      factory_->connect(project_.destination);

  if (!source->tableExists(pair.database, pair.table)) {
    throw SchemaError("source table " + pair.key() + " does not exist");
  }
  std::vector<ColumnInfo> sourceColumns =
      source->getColumns(pair.database, pair.table);
  std::vector<ColumnInfo> destColumns =
      checkDestination(*destination, pair, sourceColumns);

  outcome.sourceRows = source->countRows(pair.database, pair.table);
  if (onProgress)
    onProgress(0, outcome.sourceRows);

  std::unique_ptr<IRowReader> reader =
      source->openReader(pair.database, pair.table, sourceColumns);
  loadAndVerify(*destination, *reader, pair, sourceColumns, destColumns,
                onProgress, outcome);
}

// Copies the source table into the project's staging file and records the
// source count in the manifest. The destination is not contacted.
void TableTransferWorker::runExtract(const TablePair &pair,
                                     const ProgressCallback &onProgress,
                                     TableOutcome &outcome) const {
  std::unique_ptr<IDatabaseSession> source = factory_->connect(project_.source);

  if (!source->tableExists(pair.database, pair.table)) {
    throw SchemaError("source table " + pair.key() + " does not exist");
  }
  std::vector<ColumnInfo> sourceColumns =
      source->getColumns(pair.database, pair.table);
  outcome.sourceRows = source->countRows(pair.database, pair.table);
  if (onProgress)
    onProgress(0, outcome.sourceRows);

  std::string path =
      StagingManifest::dataFilePath(dataDirectory_, project_.name,
                                    pair.database, pair.table);
  StagedDataWriter writer(path, sourceColumns);
  std::unique_ptr<IRowReader> reader =
      source->openReader(pair.database, pair.table, sourceColumns);

  std::vector<Row> batch;
  int64_t rowsDone = 0;
  while (true) {
    batch.clear();
    size_t fetched = reader->fetch(batch, project_.options.batchSize);
    if (fetched == 0)
      break;
    writer.writeRows(batch);
    rowsDone += static_cast<int64_t>(fetched);
    if (onProgress)
      onProgress(rowsDone, outcome.sourceRows);
  }
  writer.commit();
  StagingManifest::recordTable(dataDirectory_, project_.name, pair.database,
                               pair.table, outcome.sourceRows,
                               writer.rowsWritten());

  outcome.rowsTransferred = writer.rowsWritten();
  outcome.destRowsAfter = writer.rowsWritten();
  if (writer.rowsWritten() == outcome.sourceRows) {
    outcome.status = TableStatus::COMPLETED;
  } else {
    outcome.status = TableStatus::MISMATCH;
    outcome.discrepancy = outcome.sourceRows - writer.rowsWritten();
    outcome.error = "extracted " + std::to_string(writer.rowsWritten()) +
                    " rows, source reported " +
                    std::to_string(outcome.sourceRows) + " (discrepancy " +
                    std::to_string(outcome.discrepancy) + ")";
  }
}

// Loads the staged file of this project into the destination, verifying
// against the count the extract recorded.
void TableTransferWorker::runInsert(const TablePair &pair,
                                    const ProgressCallback &onProgress,
                                    TableOutcome &outcome) const {
  std::string path = StagingManifest::dataFilePath(
      dataDirectory_, project_.name, pair.database, pair.table);
  std::optional<StagingManifest::Entry> entry = StagingManifest::lookup(
      dataDirectory_, project_.name, pair.database, pair.table);
  std::error_code ec;
  if (!entry || !std::filesystem::exists(path, ec)) {
    throw TransferError("no staged data for " + pair.key() +
                        "; run extract first");
  }

  StagedDataReader reader(path);
  outcome.sourceRows = entry->sourceRows;
  if (onProgress)
    onProgress(0, outcome.sourceRows);

  std::unique_ptr<IDatabaseSession> destination =
      factory_->connect(project_.destination);
  std::vector<ColumnInfo> destColumns =
      checkDestination(*destination, pair, reader.columns());

  loadAndVerify(*destination, reader, pair, reader.columns(), destColumns,
                onProgress, outcome);
}
