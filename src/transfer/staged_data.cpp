#include "transfer/staged_data.h"
#include "core/transfer_errors.h"
#include "utils/time_utils.h"
#include <cctype>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <system_error>

using json = nlohmann::ordered_json;

std::mutex StagingManifest::manifestMutex_;

std::string escapeStagedField(const std::optional<std::string> &value) {
  if (!value)
    return "\\N";
  std::string escaped;
  escaped.reserve(value->size());
  for (char c : *value) {
    switch (c) {
    case '\\':
      escaped += "\\\\";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    default:
      escaped += c;
    }
  }
  return escaped;
}

std::optional<std::string> unescapeStagedField(const std::string &field) {
  if (field == "\\N")
    return std::nullopt;

  std::string value;
  value.reserve(field.size());
  for (size_t i = 0; i < field.size(); ++i) {
    if (field[i] != '\\') {
      value += field[i];
      continue;
    }
    if (i + 1 >= field.size()) {
      throw TransferError("Dangling escape in staged field");
    }
    char next = field[++i];
    switch (next) {
    case '\\':
      value += '\\';
      break;
    case 't':
      value += '\t';
      break;
    case 'n':
      value += '\n';
      break;
    case 'r':
      value += '\r';
      break;
    default:
      throw TransferError(std::string("Unknown escape '\\") + next +
                          "' in staged field");
    }
  }
  return value;
}

namespace {

std::vector<std::string> splitTabs(const std::string &line) {
  std::vector<std::string> fields;
  size_t start = 0;
  while (true) {
    size_t tab = line.find('\t', start);
    if (tab == std::string::npos) {
      fields.push_back(line.substr(start));
      break;
    }
    fields.push_back(line.substr(start, tab - start));
    start = tab + 1;
  }
  return fields;
}

void writeJsonAtomically(const std::string &path, const json &document) {
  std::string tempPath = path + ".tmp";
  {
    std::ofstream out(tempPath, std::ios::trunc);
    if (!out.is_open()) {
      throw TransferError("Cannot create '" + tempPath + "'");
    }
    out << document.dump(4) << '\n';
    if (!out.good()) {
      throw TransferError("Failed writing '" + tempPath + "'");
    }
  }
  std::error_code ec;
  std::filesystem::rename(tempPath, path, ec);
  if (ec) {
    throw TransferError("Cannot replace '" + path + "': " + ec.message());
  }
}

} // namespace

// Opens "<path>.part" and writes the two header lines. The parent directory
// is created when missing.
StagedDataWriter::StagedDataWriter(std::string path,
                                   const std::vector<ColumnInfo> &columns)
    : path_(std::move(path)), partPath_(path_ + ".part"),
      columnCount_(columns.size()) {
  std::error_code ec;
  std::filesystem::path parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }

  out_.open(partPath_, std::ios::trunc | std::ios::binary);
  if (!out_.is_open()) {
    throw TransferError("Cannot create staging file '" + partPath_ + "'");
  }

  std::string names;
  std::string types;
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) {
      names += '\t';
      types += '\t';
    }
    names += escapeStagedField(columns[i].name);
    types += escapeStagedField(columns[i].dataType);
  }
  out_ << names << '\n' << types << '\n';
}

StagedDataWriter::~StagedDataWriter() {
  if (!committed_) {
    out_.close();
    std::error_code ec;
    std::filesystem::remove(partPath_, ec);
  }
}

void StagedDataWriter::writeRows(const std::vector<Row> &rows) {
  for (const auto &row : rows) {
    if (row.size() != columnCount_) {
      throw TransferError("Row has " + std::to_string(row.size()) +
                          " values, staging file expects " +
                          std::to_string(columnCount_));
    }
    for (size_t i = 0; i < row.size(); ++i) {
      if (i > 0)
        out_ << '\t';
      out_ << escapeStagedField(row[i]);
    }
    out_ << '\n';
    ++rowsWritten_;
  }
  if (!out_.good()) {
    throw TransferError("Failed writing staging file '" + partPath_ + "'");
  }
}

// Flushes the part file and renames it over the final path. Until this
// succeeds the destructor removes the part file.
void StagedDataWriter::commit() {
  out_.flush();
  if (!out_.good()) {
    throw TransferError("Failed writing staging file '" + partPath_ + "'");
  }
  out_.close();

  std::error_code ec;
  std::filesystem::rename(partPath_, path_, ec);
  if (ec) {
    throw TransferError("Cannot move staging file into place: " +
                        ec.message());
  }
  committed_ = true;
}

StagedDataReader::StagedDataReader(const std::string &path)
    : path_(path), in_(path, std::ios::binary) {
  if (!in_.is_open()) {
    throw TransferError("Cannot open staging file '" + path_ + "'");
  }

  std::string names;
  std::string types;
  if (!std::getline(in_, names) || !std::getline(in_, types)) {
    throw TransferError("Staging file '" + path_ + "' has no header");
  }
  lineNumber_ = 2;

  std::vector<std::string> nameFields = splitTabs(names);
  std::vector<std::string> typeFields = splitTabs(types);
  if (nameFields.size() != typeFields.size()) {
    throw TransferError("Staging file '" + path_ + "' has a corrupt header");
  }
  for (size_t i = 0; i < nameFields.size(); ++i) {
    ColumnInfo column;
    column.name = unescapeStagedField(nameFields[i]).value_or("");
    column.dataType = unescapeStagedField(typeFields[i]).value_or("");
    columns_.push_back(column);
  }
}

// Appends up to maxRows decoded rows to out; returns how many were read, 0 at
// end of file. A line with the wrong field count is reported with its line
// number.
size_t StagedDataReader::fetch(std::vector<Row> &out, size_t maxRows) {
  size_t fetched = 0;
  std::string line;
  while (fetched < maxRows && std::getline(in_, line)) {
    ++lineNumber_;
    std::vector<std::string> fields = splitTabs(line);
    if (fields.size() != columns_.size()) {
      throw TransferError("Staging file '" + path_ + "' line " +
                          std::to_string(lineNumber_) + " has " +
                          std::to_string(fields.size()) + " fields, expected " +
                          std::to_string(columns_.size()));
    }
    Row row;
    row.reserve(fields.size());
    for (const auto &field : fields) {
      row.push_back(unescapeStagedField(field));
    }
    out.push_back(std::move(row));
    ++fetched;
  }
  if (in_.bad()) {
    throw TransferError("Failed reading staging file '" + path_ + "'");
  }
  return fetched;
}

std::string StagingManifest::projectDirectory(const std::string &dataDirectory,
                                              const std::string &project) {
  std::string safe;
  safe.reserve(project.size());
  for (char c : project) {
    unsigned char u = static_cast<unsigned char>(c);
    safe += (std::isalnum(u) || c == '_' || c == '-' || c == '.') ? c : '_';
  }
  return (std::filesystem::path(dataDirectory) / ("transfer_data_" + safe))
      .string();
}

std::string StagingManifest::dataFilePath(const std::string &dataDirectory,
                                          const std::string &project,
                                          const std::string &database,
                                          const std::string &table) {
  return (std::filesystem::path(projectDirectory(dataDirectory, project)) /
          (database + "_" + table + ".dat"))
      .string();
}

std::string StagingManifest::manifestPath(const std::string &dataDirectory,
                                          const std::string &project,
                                          const std::string &database) {
  return (std::filesystem::path(projectDirectory(dataDirectory, project)) /
          (database + "_manifest.json"))
      .string();
}

// Adds or replaces the entry of one table in its database manifest. The
// manifest is read, updated and rewritten under a process-wide lock so pool
// threads extracting tables of the same database do not lose entries.
void StagingManifest::recordTable(const std::string &dataDirectory,
                                  const std::string &project,
                                  const std::string &database,
                                  const std::string &table,
                                  int64_t sourceRows, int64_t rowsWritten) {
  std::lock_guard<std::mutex> lock(manifestMutex_);
  std::string path = manifestPath(dataDirectory, project, database);

  json document = json::object();
  std::ifstream in(path);
  if (in.is_open()) {
    try {
      in >> document;
    } catch (const json::exception &e) {
      throw TransferError("Manifest '" + path + "' is corrupt: " + e.what());
    }
  }
  document["PROJECT"] = project;
  document["DATABASE"] = database;
  if (!document.contains("TABLES") || !document["TABLES"].is_object()) {
    document["TABLES"] = json::object();
  }
  document["TABLES"][table] = {
      {"source_rows", sourceRows},
      {"rows_written", rowsWritten},
      {"file", database + "_" + table + ".dat"},
      {"extracted_at", TimeUtils::getIsoTimestamp()}};

  std::error_code ec;
  std::filesystem::create_directories(
      std::filesystem::path(path).parent_path(), ec);
  writeJsonAtomically(path, document);
}

// Returns the manifest entry of a table, or nothing when the table was never
// extracted for this project. A manifest that does not parse is an error.
std::optional<StagingManifest::Entry>
StagingManifest::lookup(const std::string &dataDirectory,
                        const std::string &project, const std::string &database,
                        const std::string &table) {
  std::lock_guard<std::mutex> lock(manifestMutex_);
  std::ifstream in(manifestPath(dataDirectory, project, database));
  if (!in.is_open())
    return std::nullopt;

  json document;
  try {
    in >> document;
  } catch (const json::exception &e) {
    throw TransferError("Manifest for " + database + " is corrupt: " +
                        e.what());
  }
  if (!document.contains("TABLES") || !document["TABLES"].contains(table))
    return std::nullopt;

  const json &node = document["TABLES"][table];
  Entry entry;
  entry.sourceRows = node.value("source_rows", static_cast<int64_t>(0));
  entry.rowsWritten = node.value("rows_written", static_cast<int64_t>(0));
  entry.extractedAt = node.value("extracted_at", std::string());
  return entry;
}
