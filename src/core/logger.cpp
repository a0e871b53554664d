#include "core/logger.h"
#include "core/app_config.h"
#include "utils/string_utils.h"
#include <algorithm>

std::unique_ptr<FileLogWriter> Logger::fileWriter_;
std::unique_ptr<DatabaseLogWriter> Logger::dbWriter_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
bool Logger::consoleEnabled = false;
bool Logger::showThreadId = false;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

std::string Logger::getLevelString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::getCategoryString(LogCategory category) {
  switch (category) {
  case LogCategory::SYSTEM:
    return "SYSTEM";
  case LogCategory::DATABASE:
    return "DATABASE";
  case LogCategory::TRANSFER:
    return "TRANSFER";
  case LogCategory::CONFIG:
    return "CONFIG";
  case LogCategory::STATE:
    return "STATE";
  case LogCategory::VALIDATION:
    return "VALIDATION";
  case LogCategory::PROJECT:
    return "PROJECT";
  default:
    return "UNKNOWN";
  }
}

// Formats one entry and hands it to every open sink. The file writer and the
// database writer each serialize their own I/O, so logMutex is only held
// while the sink pointers are read; a slow PostgreSQL insert never blocks
// another worker's file write for longer than its own call.
void Logger::writeLog(LogLevel level, LogCategory category,
                      const std::string &function,
                      const std::string &message) {
  LogLevel minLevel;
  bool toConsole;
  bool withThreadId;
  {
    std::lock_guard<std::mutex> configLock(configMutex);
    minLevel = currentLogLevel;
    toConsole = consoleEnabled;
    withThreadId = showThreadId;
  }

  if (level < minLevel) {
    return;
  }

  std::string levelStr = getLevelString(level);
  std::string categoryStr = getCategoryString(category);
  std::string formatted =
      formatLogMessage(getCurrentTimestamp(), levelStr, categoryStr, function,
                       message, withThreadId);

  FileLogWriter *fileWriter = nullptr;
  DatabaseLogWriter *dbWriter = nullptr;
  {
    std::lock_guard<std::mutex> lock(logMutex);
    if (fileWriter_ && fileWriter_->isOpen()) {
      fileWriter = fileWriter_.get();
    }
    if (dbWriter_ && dbWriter_->isEnabled() && dbWriter_->isOpen()) {
      dbWriter = dbWriter_.get();
    }
  }

  if (fileWriter) {
    fileWriter->write(formatted);
  }
  if (dbWriter) {
    dbWriter->writeParsed(levelStr, categoryStr, function, message);
  }
  if (toConsole) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::cerr << formatted << std::endl;
  }
}

void Logger::initialize() {
  LoggerSettings settings;
  settings.level = stringToLogLevel(StringUtils::toUpper(AppConfig::getLogLevel()));
  settings.filePath = AppConfig::getLogFile();
  settings.maxFileSize = AppConfig::getLogMaxFileSize();
  settings.maxBackupFiles = AppConfig::getLogMaxBackupFiles();
  settings.postgresConnection = AppConfig::getLogPostgresConnection();
  initialize(settings);
}

// Replaces any previously opened sinks. A PostgreSQL sink that cannot connect
// is dropped with a warning on stderr; logging continues to the file.
void Logger::initialize(const LoggerSettings &settings) {
  {
    std::lock_guard<std::mutex> configLock(configMutex);
    currentLogLevel = settings.level;
    consoleEnabled = settings.console;
    showThreadId = settings.showThreadId;
  }

  std::lock_guard<std::mutex> lock(logMutex);
  fileWriter_.reset();
  dbWriter_.reset();

  if (!settings.filePath.empty()) {
    fileWriter_ = std::make_unique<FileLogWriter>(
        settings.filePath, settings.maxFileSize, settings.maxBackupFiles);
    if (!fileWriter_->isOpen()) {
      std::cerr << "Warning: could not open log file '" << settings.filePath
                << "'. File logging disabled." << std::endl;
      fileWriter_.reset();
    }
  }

  if (!settings.postgresConnection.empty()) {
    try {
      dbWriter_ = std::make_unique<DatabaseLogWriter>(
          settings.postgresConnection, AppConfig::getLogPostgresTable());
      if (!dbWriter_->isEnabled()) {
        std::cerr << "Warning: Database log writer initialization failed. "
                     "Logging to database will be disabled."
                  << std::endl;
        dbWriter_.reset();
      }
    } catch (const std::exception &e) {
      std::cerr << "Error initializing database log writer: " << e.what()
                << std::endl;
      dbWriter_.reset();
    }
  }
}

void Logger::shutdown() {
  std::lock_guard<std::mutex> lock(logMutex);
  if (fileWriter_) {
    fileWriter_->close();
  }
  if (dbWriter_) {
    dbWriter_->close();
  }
  fileWriter_.reset();
  dbWriter_.reset();
}
