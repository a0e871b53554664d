#include "project/transfer_project.h"
#include "core/transfer_defaults.h"
#include "core/transfer_errors.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <unordered_set>

using json = nlohmann::ordered_json;

int ConnectionDescriptor::effectivePort() const {
  if (port > 0)
    return port;
  return platform == DatabasePlatform::SYBASE ? TransferDefaults::SYBASE_PORT
                                              : TransferDefaults::MSSQL_PORT;
}

std::string platformToString(DatabasePlatform platform) {
  switch (platform) {
  case DatabasePlatform::MSSQL:
    return "MSSQL";
  case DatabasePlatform::SYBASE:
    return "SYBASE";
  default:
    return "UNKNOWN";
  }
}

DatabasePlatform parsePlatform(const std::string &value) {
  std::string upper = StringUtils::toUpper(StringUtils::trim(value));
  if (upper == "MSSQL" || upper == "SQLSERVER")
    return DatabasePlatform::MSSQL;
  if (upper == "SYBASE" || upper == "ASE")
    return DatabasePlatform::SYBASE;
  throw ConfigurationError("Unsupported platform: '" + value +
                           "' (expected MSSQL or SYBASE)");
}

std::string modeToString(TransferMode mode) {
  return mode == TransferMode::APPEND ? "APPEND" : "TRUNCATE";
}

TransferMode parseMode(const std::string &value) {
  std::string upper = StringUtils::toUpper(StringUtils::trim(value));
  if (upper == "APPEND")
    return TransferMode::APPEND;
  if (upper == "TRUNCATE")
    return TransferMode::TRUNCATE;
  throw ConfigurationError("Unsupported transfer mode: '" + value +
                           "' (expected APPEND or TRUNCATE)");
}

std::string loadMethodToString(LoadMethod method) {
  return method == LoadMethod::BCP ? "BCP" : "INSERT";
}

LoadMethod parseLoadMethod(const std::string &value) {
  std::string upper = StringUtils::toUpper(StringUtils::trim(value));
  if (upper == "INSERT")
    return LoadMethod::INSERT;
  if (upper == "BCP")
    return LoadMethod::BCP;
  throw ConfigurationError("Unsupported load method: '" + value +
                           "' (expected INSERT or BCP)");
}

namespace {

json connectionToJson(const ConnectionDescriptor &conn) {
  json node;
  node["PLATFORM"] = platformToString(conn.platform);
  node["HOST"] = conn.host;
  node["PORT"] = conn.effectivePort();
  node["USERNAME"] = conn.username;
  node["PASSWORD"] = conn.password;
  return node;
}

std::string requireString(const json &node, const char *key,
                          const std::string &context) {
  if (!node.contains(key) || !node[key].is_string()) {
    throw ConfigurationError(context + ": missing or non-string " + key);
  }
  return node[key].get<std::string>();
}

ConnectionDescriptor connectionFromJson(const json &node,
                                        const std::string &context) {
  if (!node.is_object()) {
    throw ConfigurationError(context + " must be an object");
  }
  ConnectionDescriptor conn;
  conn.platform = parsePlatform(requireString(node, "PLATFORM", context));
  conn.host = requireString(node, "HOST", context);
  if (node.contains("PORT")) {
    if (node["PORT"].is_number_integer()) {
      conn.port = node["PORT"].get<int>();
    } else if (node["PORT"].is_string()) {
      std::string text = StringUtils::trim(node["PORT"].get<std::string>());
      try {
        conn.port = text.empty() ? 0 : std::stoi(text);
      } catch (const std::exception &) {
        throw ConfigurationError(context + ": invalid PORT '" + text + "'");
      }
    }
  }
  if (node.contains("USERNAME") && node["USERNAME"].is_string())
    conn.username = node["USERNAME"].get<std::string>();
  if (node.contains("PASSWORD") && node["PASSWORD"].is_string())
    conn.password = node["PASSWORD"].get<std::string>();
  return conn;
}

std::vector<std::string> stringList(const json &node, const char *key,
                                    const std::string &context) {
  std::vector<std::string> values;
  if (!node.contains(key))
    return values;
  if (!node[key].is_array()) {
    throw ConfigurationError(context + ": " + key + " must be an array");
  }
  for (const auto &item : node[key]) {
    if (!item.is_string()) {
      throw ConfigurationError(context + ": " + key +
                               " must contain only strings");
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}

DatabaseMapping mappingFromJson(const json &node, const std::string &sourceName,
                                const std::string &context) {
  DatabaseMapping mapping;
  mapping.sourceDatabase = sourceName;
  if (node.contains("DEST_DATABASE") && node["DEST_DATABASE"].is_string())
    mapping.destDatabase = node["DEST_DATABASE"].get<std::string>();
  mapping.tables = stringList(node, "TABLES", context);
  mapping.excludedTables = stringList(node, "EXCLUDED_TABLES", context);
  return mapping;
}

} // namespace

json projectToJson(const TransferProject &project) {
  json node;
  node["SOURCE"] = connectionToJson(project.source);
  node["DESTINATION"] = connectionToJson(project.destination);

  json databases = json::array();
  for (const auto &mapping : project.databases) {
    json entry;
    entry["SOURCE_DATABASE"] = mapping.sourceDatabase;
    entry["DEST_DATABASE"] = mapping.destinationName();
    entry["TABLES"] = mapping.tables;
    entry["EXCLUDED_TABLES"] = mapping.excludedTables;
    databases.push_back(entry);
  }
  node["DATABASES"] = databases;

  node["OPTIONS"] = {{"MODE", modeToString(project.options.mode)},
                     {"BATCH_SIZE", project.options.batchSize},
                     {"THREADS", project.options.threads},
                     {"LOAD_METHOD",
                      loadMethodToString(project.options.loadMethod)}};
  return node;
}

TransferProject projectFromJson(const std::string &name, const json &node) {
  if (!node.is_object()) {
    throw ConfigurationError("Project '" + name + "' is not a JSON object");
  }

  TransferProject project;
  project.name = name;

  if (!node.contains("SOURCE") || !node.contains("DESTINATION")) {
    throw ConfigurationError("Project '" + name +
                             "' must define SOURCE and DESTINATION");
  }
  project.source = connectionFromJson(node["SOURCE"], name + ".SOURCE");
  project.destination =
      connectionFromJson(node["DESTINATION"], name + ".DESTINATION");

  if (node.contains("DATABASES")) {
    const json &databases = node["DATABASES"];
    if (databases.is_array()) {
      for (const auto &entry : databases) {
        std::string context = name + ".DATABASES";
        if (!entry.is_object()) {
          throw ConfigurationError(context + " entries must be objects");
        }
        project.databases.push_back(mappingFromJson(
            entry, requireString(entry, "SOURCE_DATABASE", context), context));
      }
    } else if (databases.is_object()) {
      // Object-keyed form written by earlier releases of the tool.
      for (auto it = databases.begin(); it != databases.end(); ++it) {
        project.databases.push_back(mappingFromJson(
            it.value(), it.key(), name + ".DATABASES." + it.key()));
      }
    } else {
      throw ConfigurationError(name + ".DATABASES must be an array");
    }
  }

  if (node.contains("OPTIONS") && node["OPTIONS"].is_object()) {
    const json &opts = node["OPTIONS"];
    if (opts.contains("MODE") && opts["MODE"].is_string())
      project.options.mode = parseMode(opts["MODE"].get<std::string>());
    if (opts.contains("BATCH_SIZE") && opts["BATCH_SIZE"].is_number_integer()) {
      long long batch = opts["BATCH_SIZE"].get<long long>();
      if (batch < static_cast<long long>(TransferDefaults::MIN_BATCH_SIZE) ||
          batch > static_cast<long long>(TransferDefaults::MAX_BATCH_SIZE)) {
        throw ConfigurationError(
            name + ".OPTIONS.BATCH_SIZE must be between " +
            std::to_string(TransferDefaults::MIN_BATCH_SIZE) + " and " +
            std::to_string(TransferDefaults::MAX_BATCH_SIZE));
      }
      project.options.batchSize = static_cast<size_t>(batch);
    }
    if (opts.contains("THREADS") && opts["THREADS"].is_number_integer()) {
      long long threads = opts["THREADS"].get<long long>();
      threads = std::max<long long>(
          static_cast<long long>(TransferDefaults::MIN_THREADS),
          std::min<long long>(threads, static_cast<long long>(
                                           TransferDefaults::MAX_THREADS)));
      project.options.threads = static_cast<size_t>(threads);
    }
    if (opts.contains("LOAD_METHOD") && opts["LOAD_METHOD"].is_string())
      project.options.loadMethod =
          parseLoadMethod(opts["LOAD_METHOD"].get<std::string>());
  }

  return project;
}

void validateProject(const TransferProject &project) {
  if (StringUtils::trim(project.name).empty()) {
    throw ConfigurationError("Project name cannot be empty");
  }
  if (StringUtils::trim(project.source.host).empty()) {
    throw ConfigurationError("Project '" + project.name +
                             "': source host is not set");
  }
  if (StringUtils::trim(project.destination.host).empty()) {
    throw ConfigurationError("Project '" + project.name +
                             "': destination host is not set");
  }
  if (project.databases.empty()) {
    throw ConfigurationError("Project '" + project.name +
                             "' has no database mappings");
  }
  if (project.options.batchSize < TransferDefaults::MIN_BATCH_SIZE ||
      project.options.batchSize > TransferDefaults::MAX_BATCH_SIZE) {
    throw ConfigurationError("Project '" + project.name +
                             "': batch size out of range");
  }
  if (project.options.threads < TransferDefaults::MIN_THREADS ||
      project.options.threads > TransferDefaults::MAX_THREADS) {
    throw ConfigurationError("Project '" + project.name +
                             "': thread count out of range");
  }

  std::unordered_set<std::string> seenDatabases;
  for (const auto &mapping : project.databases) {
    if (!StringUtils::isValidDatabaseIdentifier(mapping.sourceDatabase)) {
      throw ConfigurationError("Project '" + project.name +
                               "': invalid source database name '" +
                               mapping.sourceDatabase + "'");
    }
    if (!StringUtils::isValidDatabaseIdentifier(mapping.destinationName())) {
      throw ConfigurationError("Project '" + project.name +
                               "': invalid destination database name '" +
                               mapping.destinationName() + "'");
    }
    if (!seenDatabases.insert(StringUtils::toLower(mapping.sourceDatabase))
             .second) {
      throw ConfigurationError("Project '" + project.name + "': database '" +
                               mapping.sourceDatabase + "' is mapped twice");
    }

    std::unordered_set<std::string> seenTables;
    for (const auto &table : mapping.tables) {
      if (!StringUtils::isValidDatabaseIdentifier(table)) {
        throw ConfigurationError("Project '" + project.name +
                                 "': invalid table name '" + table + "' in " +
                                 mapping.sourceDatabase);
      }
      if (!seenTables.insert(StringUtils::toLower(table)).second) {
        throw ConfigurationError("Project '" + project.name + "': table '" +
                                 table + "' listed twice in " +
                                 mapping.sourceDatabase);
      }
    }
  }
}

std::vector<TablePair> buildWorkList(const TransferProject &project) {
  std::vector<TablePair> work;
  for (const auto &mapping : project.databases) {
    for (const auto &table : mapping.tables) {
      work.push_back({mapping.sourceDatabase, mapping.destinationName(), table});
    }
  }
  return work;
}
