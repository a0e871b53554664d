#ifndef APP_CONFIG_H
#define APP_CONFIG_H

#include <mutex>
#include <string>

// Process-wide settings for the transfer tool. Values come from config.json
// (optional) and are then overridden by environment variables:
//   TRANSFER_SETTINGS, TRANSFER_DATA_DIR, TRANSFER_ODBC_DRIVER,
//   TRANSFER_BCP_COMMAND, TRANSFER_LOG_LEVEL, TRANSFER_LOG_FILE,
//   TRANSFER_LOG_POSTGRES.
class AppConfig {
private:
  static std::string settingsPath_;
  static std::string dataDirectory_;
  static std::string odbcDriver_;
  static std::string mssqlTdsVersion_;
  static std::string sybaseTdsVersion_;
  static std::string bcpCommand_;
  static int progressRefreshHz_;
  static std::string logLevel_;
  static std::string logFile_;
  static size_t logMaxFileSize_;
  static int logMaxBackupFiles_;
  static std::string logPostgresConnection_;
  static std::string logPostgresTable_;
  static bool initialized_;
  static std::mutex configMutex_;

  static void loadFromEnvUnlocked();

public:
  static void loadFromFile(const std::string &configPath = "config.json");
  static void resetToDefaults();

  static std::string getSettingsPath();
  static std::string getDataDirectory();
  static std::string getOdbcDriver();
  static std::string getMssqlTdsVersion();
  static std::string getSybaseTdsVersion();
  static std::string getBcpCommand();
  static int getProgressRefreshHz();
  static std::string getLogLevel();
  static std::string getLogFile();
  static size_t getLogMaxFileSize();
  static int getLogMaxBackupFiles();
  static std::string getLogPostgresConnection();
  static std::string getLogPostgresTable();
  static bool isInitialized();

  static void setSettingsPath(const std::string &path);
  static void setDataDirectory(const std::string &path);
  static void setProgressRefreshHz(int hz);
  static void setLogLevel(const std::string &level);
};

#endif
