#include "transfer/table_loader.h"
#include "core/logger.h"
#include "core/transfer_errors.h"
#include "utils/string_utils.h"
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

InsertBatchLoader::InsertBatchLoader(IDatabaseSession &destination,
                                     std::string database, std::string table,
                                     std::vector<ColumnInfo> columns)
    : destination_(destination), database_(std::move(database)),
      table_(std::move(table)), columns_(std::move(columns)) {}

void InsertBatchLoader::writeBatch(const std::vector<Row> &rows) {
  destination_.insertRows(database_, table_, columns_, rows);
  rowsLoaded_ += static_cast<int64_t>(rows.size());
}

BulkCopyLoader::BulkCopyLoader(IBulkCopyRunner &runner,
                               ConnectionDescriptor destination,
                               std::string database, std::string table,
                               const std::vector<ColumnInfo> &sourceColumns,
                               const std::vector<ColumnInfo> &destinationColumns,
                               std::string spoolPath)
    : runner_(runner), destination_(std::move(destination)),
      database_(std::move(database)), table_(std::move(table)),
      spoolPath_(std::move(spoolPath)) {
  for (const auto &destColumn : destinationColumns) {
    int index = -1;
    for (size_t i = 0; i < sourceColumns.size(); ++i) {
      if (StringUtils::equalsIgnoreCase(sourceColumns[i].name,
                                        destColumn.name)) {
        index = static_cast<int>(i);
        break;
      }
    }
    sourceIndex_.push_back(index);
  }

  std::error_code ec;
  std::filesystem::path parent =
      std::filesystem::path(spoolPath_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  spool_.open(spoolPath_, std::ios::trunc | std::ios::binary);
  if (!spool_.is_open()) {
    throw TransferError("Cannot create bcp spool file '" + spoolPath_ + "'");
  }
}

BulkCopyLoader::~BulkCopyLoader() {
  if (spool_.is_open())
    spool_.close();
  std::error_code ec;
  std::filesystem::remove(spoolPath_, ec);
}

// Appends rows to the spool file in destination column order. A destination
// column with no source counterpart, or a NULL value, is an empty field.
void BulkCopyLoader::writeBatch(const std::vector<Row> &rows) {
  for (const auto &row : rows) {
    for (size_t i = 0; i < sourceIndex_.size(); ++i) {
      if (i > 0)
        spool_ << '\t';
      int source = sourceIndex_[i];
      if (source < 0 || static_cast<size_t>(source) >= row.size() ||
          !row[source]) {
        continue;
      }
      const std::string &value = *row[source];
      if (value.empty()) {
        throw QueryError("A value in " + database_ + ".." + table_ +
                         " is an empty string, which bcp character format "
                         "loads as NULL; use LOAD_METHOD INSERT");
      }
      if (value.find_first_of("\t\r\n") != std::string::npos) {
        throw QueryError("A value in " + database_ + ".." + table_ +
                         " contains a tab or line break, which bcp character "
                         "format cannot carry; use LOAD_METHOD INSERT");
      }
      spool_ << value;
    }
    spool_ << '\n';
    ++rowsSpooled_;
  }
  if (!spool_.good()) {
    throw TransferError("Failed writing bcp spool file '" + spoolPath_ + "'");
  }
}

// Runs bcp in over the spool file and returns the count bcp reported.
int64_t BulkCopyLoader::finish() {
  spool_.flush();
  if (!spool_.good()) {
    throw TransferError("Failed writing bcp spool file '" + spoolPath_ + "'");
  }
  spool_.close();

  if (rowsSpooled_ == 0)
    return 0;

  int64_t copied = runner_.bulkLoad(destination_, database_, table_,
                                    BulkDirection::IN, spoolPath_);
  Logger::info(LogCategory::TRANSFER, "BulkCopyLoader::finish",
               database_ + ".." + table_ + ": bcp reported " +
                   std::to_string(copied) + " of " +
                   std::to_string(rowsSpooled_) + " rows copied");
  return copied;
}

std::unique_ptr<ITableLoader> createTableLoader(const LoaderContext &context) {
  if (!context.destination) {
    throw std::invalid_argument("createTableLoader: no destination session");
  }

  // Column names as the destination spells them; types from the source so
  // binary values are emitted as 0x literals.
  std::vector<ColumnInfo> insertColumns;
  for (const auto &sourceColumn : context.sourceColumns) {
    ColumnInfo column = sourceColumn;
    for (const auto &destColumn : context.destinationColumns) {
      if (StringUtils::equalsIgnoreCase(destColumn.name, sourceColumn.name)) {
        column.name = destColumn.name;
        break;
      }
    }
    insertColumns.push_back(column);
  }

  if (context.method == LoadMethod::BCP) {
    if (!context.bulkCopy) {
      throw std::invalid_argument("createTableLoader: BCP needs a runner");
    }
    std::ostringstream suffix;
    suffix << std::this_thread::get_id();
    std::string spoolPath =
        (std::filesystem::path(context.spoolDirectory) /
         (context.database + "_" + context.table + "." + suffix.str() + ".bcp"))
            .string();
    return std::make_unique<BulkCopyLoader>(
        *context.bulkCopy, context.destinationConnection, context.database,
        context.table, context.sourceColumns, context.destinationColumns,
        spoolPath);
  }

  return std::make_unique<InsertBatchLoader>(*context.destination,
                                             context.database, context.table,
                                             insertColumns);
}
