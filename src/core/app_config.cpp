#include "core/app_config.h"
#include "core/logger.h"
#include "core/transfer_defaults.h"
#include "utils/string_utils.h"
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

std::string AppConfig::settingsPath_ = "settings.json";
std::string AppConfig::dataDirectory_ = ".";
std::string AppConfig::odbcDriver_ = "FreeTDS";
std::string AppConfig::mssqlTdsVersion_ = "7.4";
std::string AppConfig::sybaseTdsVersion_ = "5.0";
std::string AppConfig::bcpCommand_ = "freebcp";
int AppConfig::progressRefreshHz_ = TransferDefaults::DEFAULT_PROGRESS_HZ;
std::string AppConfig::logLevel_ = "INFO";
std::string AppConfig::logFile_ = "transfer_data.log";
size_t AppConfig::logMaxFileSize_ = 10 * 1024 * 1024;
int AppConfig::logMaxBackupFiles_ = 5;
std::string AppConfig::logPostgresConnection_ = "";
std::string AppConfig::logPostgresTable_ = "transfer_logs";
bool AppConfig::initialized_ = false;
std::mutex AppConfig::configMutex_;

namespace {

void readString(const json &node, const char *key, std::string &target) {
  if (node.contains(key) && node[key].is_string()) {
    std::string value = node[key].get<std::string>();
    if (!value.empty())
      target = value;
  }
}

void checkRefreshHz(int hz) {
  if (hz < TransferDefaults::MIN_PROGRESS_HZ ||
      hz > TransferDefaults::MAX_PROGRESS_HZ) {
    throw std::invalid_argument(
        "progress_refresh_hz must be between " +
        std::to_string(TransferDefaults::MIN_PROGRESS_HZ) + " and " +
        std::to_string(TransferDefaults::MAX_PROGRESS_HZ));
  }
}

} // namespace

// Reads the "transfer" object of config.json:
//
//   {"transfer": {"settings_path": "...", "data_directory": "...",
//                 "odbc_driver": "FreeTDS", "bcp_command": "freebcp",
//                 "mssql_tds_version": "7.4", "sybase_tds_version": "5.0",
//                 "progress_refresh_hz": 4,
//                 "logging": {"level": "INFO", "file": "...",
//                             "max_file_size": 10485760,
//                             "max_backup_files": 5,
//                             "postgres_connection": "...",
//                             "postgres_table": "transfer_logs"}}}
//
// A missing file is not an error (defaults plus environment apply). A file
// that exists but cannot be parsed is: the tool refuses to guess where the
// project settings live.
void AppConfig::loadFromFile(const std::string &configPath) {
  std::lock_guard<std::mutex> lock(configMutex_);

  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    loadFromEnvUnlocked();
    initialized_ = true;
    return;
  }

  json config;
  try {
    configFile >> config;
  } catch (const json::exception &e) {
    throw std::runtime_error("Cannot parse config file '" + configPath +
                             "': " + e.what());
  }

  if (config.contains("transfer") && config["transfer"].is_object()) {
    const json &t = config["transfer"];
    readString(t, "settings_path", settingsPath_);
    readString(t, "data_directory", dataDirectory_);
    readString(t, "odbc_driver", odbcDriver_);
    readString(t, "mssql_tds_version", mssqlTdsVersion_);
    readString(t, "sybase_tds_version", sybaseTdsVersion_);
    readString(t, "bcp_command", bcpCommand_);

    if (t.contains("progress_refresh_hz")) {
      int hz = t["progress_refresh_hz"].get<int>();
      checkRefreshHz(hz);
      progressRefreshHz_ = hz;
    }

    if (t.contains("logging") && t["logging"].is_object()) {
      const json &l = t["logging"];
      readString(l, "level", logLevel_);
      if (l.contains("file") && l["file"].is_string()) {
        logFile_ = l["file"].get<std::string>();
      }
      if (l.contains("max_file_size")) {
        logMaxFileSize_ = l["max_file_size"].get<size_t>();
      }
      if (l.contains("max_backup_files")) {
        logMaxBackupFiles_ = l["max_backup_files"].get<int>();
      }
      readString(l, "postgres_connection", logPostgresConnection_);
      readString(l, "postgres_table", logPostgresTable_);
    }
  }

  loadFromEnvUnlocked();
  initialized_ = true;
}

void AppConfig::loadFromEnvUnlocked() {
  auto apply = [](const char *name, std::string &target) {
    const char *value = std::getenv(name);
    if (value && std::strlen(value) > 0)
      target = value;
  };

  apply("TRANSFER_SETTINGS", settingsPath_);
  apply("TRANSFER_DATA_DIR", dataDirectory_);
  apply("TRANSFER_ODBC_DRIVER", odbcDriver_);
  apply("TRANSFER_BCP_COMMAND", bcpCommand_);
  apply("TRANSFER_LOG_LEVEL", logLevel_);
  apply("TRANSFER_LOG_FILE", logFile_);
  apply("TRANSFER_LOG_POSTGRES", logPostgresConnection_);
}

void AppConfig::resetToDefaults() {
  std::lock_guard<std::mutex> lock(configMutex_);
  settingsPath_ = "settings.json";
  dataDirectory_ = ".";
  odbcDriver_ = "FreeTDS";
  mssqlTdsVersion_ = "7.4";
  sybaseTdsVersion_ = "5.0";
  bcpCommand_ = "freebcp";
  progressRefreshHz_ = TransferDefaults::DEFAULT_PROGRESS_HZ;
  logLevel_ = "INFO";
  logFile_ = "transfer_data.log";
  logMaxFileSize_ = 10 * 1024 * 1024;
  logMaxBackupFiles_ = 5;
  logPostgresConnection_.clear();
  logPostgresTable_ = "transfer_logs";
  initialized_ = false;
}

std::string AppConfig::getSettingsPath() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return settingsPath_;
}

std::string AppConfig::getDataDirectory() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return dataDirectory_;
}

std::string AppConfig::getOdbcDriver() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return odbcDriver_;
}

std::string AppConfig::getMssqlTdsVersion() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return mssqlTdsVersion_;
}

std::string AppConfig::getSybaseTdsVersion() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return sybaseTdsVersion_;
}

std::string AppConfig::getBcpCommand() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return bcpCommand_;
}

int AppConfig::getProgressRefreshHz() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return progressRefreshHz_;
}

std::string AppConfig::getLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return logLevel_;
}

std::string AppConfig::getLogFile() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return logFile_;
}

size_t AppConfig::getLogMaxFileSize() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return logMaxFileSize_;
}

int AppConfig::getLogMaxBackupFiles() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return logMaxBackupFiles_;
}

std::string AppConfig::getLogPostgresConnection() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return logPostgresConnection_;
}

std::string AppConfig::getLogPostgresTable() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return logPostgresTable_;
}

bool AppConfig::isInitialized() {
  std::lock_guard<std::mutex> lock(configMutex_);
  return initialized_;
}

void AppConfig::setSettingsPath(const std::string &path) {
  if (StringUtils::trim(path).empty()) {
    throw std::invalid_argument("settings path cannot be empty");
  }
  std::lock_guard<std::mutex> lock(configMutex_);
  settingsPath_ = path;
}

void AppConfig::setDataDirectory(const std::string &path) {
  if (StringUtils::trim(path).empty()) {
    throw std::invalid_argument("data directory cannot be empty");
  }
  std::lock_guard<std::mutex> lock(configMutex_);
  dataDirectory_ = path;
}

void AppConfig::setProgressRefreshHz(int hz) {
  checkRefreshHz(hz);
  std::lock_guard<std::mutex> lock(configMutex_);
  progressRefreshHz_ = hz;
}

void AppConfig::setLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(configMutex_);
  logLevel_ = level;
}
