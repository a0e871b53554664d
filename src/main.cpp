#include "cli/console_shell.h"
#include "core/app_config.h"
#include "core/logger.h"
#include "core/transfer_errors.h"
#include "engines/bulk_copy.h"
#include "engines/database_discovery.h"
#include "engines/odbc_session.h"
#include "project/project_store.h"
#include "transfer/transfer_engine.h"
#include "utils/pattern_matcher.h"
#include "utils/string_utils.h"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <vector>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_TRANSFER_INCOMPLETE = 1;
constexpr int EXIT_INIT_ERROR = 2;
constexpr int EXIT_EXECUTION_ERROR = 3;
constexpr int EXIT_CRITICAL_ERROR = 4;
constexpr int EXIT_UNKNOWN_ERROR = 5;
constexpr int EXIT_CONFIG_ERROR = 6;
constexpr int EXIT_SIGNAL_ERROR = 7;
constexpr int EXIT_USAGE_ERROR = 64;

std::atomic<bool> g_shutdownRequested{false};
std::mutex g_consoleMutex;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

void cleanupLogger() {
  try {
    Logger::shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Logger shutdown failed: " << e.what() << std::endl;
  }
}

void printUsage() {
  std::cerr
      << "Usage: transfer_data [options] <command>\n"
         "\n"
         "Options:\n"
         "  --config <file>      Tool configuration (default config.json)\n"
         "  --settings <file>    Project settings file\n"
         "  --data-dir <dir>     Directory for staging and spool files\n"
         "  -v, --verbose        Debug logging\n"
         "\n"
         "Commands:\n"
         "  list                                 List transfer projects\n"
         "  show <project>                       Show a project\n"
         "  delete <project>                     Delete a project\n"
         "  import <project> <file.json>         Create or replace a project\n"
         "  databases <project>                  List source databases\n"
         "  select-tables <project> <database> [--include p,..] "
         "[--exclude p,..]\n"
         "                                       Pick tables from the source\n"
         "  status <project>                     Show transfer state\n"
         "  reset <project>                      Clear transfer state\n"
         "  run <project> [--extract-only | --insert-only] [--yes]\n"
         "                                       Run the transfer\n";
}

int listProjects(ProjectStore &store) {
  std::vector<std::string> names = store.list();
  if (names.empty()) {
    std::cout << "No data transfer projects found." << std::endl;
    return EXIT_SUCCESS_CODE;
  }
  std::cout << "=== Data Transfer Projects ===" << std::endl;
  for (const auto &name : names) {
    std::cout << "  " << name << std::endl;
  }
  return EXIT_SUCCESS_CODE;
}

int importProject(ProjectStore &store, const std::string &name,
                  const std::string &file) {
  std::ifstream in(file);
  if (!in.is_open()) {
    std::cerr << "Cannot open '" << file << "'" << std::endl;
    return EXIT_CONFIG_ERROR;
  }
  nlohmann::ordered_json node;
  try {
    in >> node;
  } catch (const nlohmann::json::exception &e) {
    std::cerr << "Invalid JSON in '" << file << "': " << e.what() << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  TransferProject project = projectFromJson(name, node);
  store.save(project);
  std::cout << "Project '" << name << "' saved to " << store.path()
            << std::endl;
  return EXIT_SUCCESS_CODE;
}

int listSourceDatabases(ProjectStore &store,
                        std::shared_ptr<IConnectionFactory> factory,
                        const std::string &name) {
  TransferProject project = store.load(name);
  DatabaseDiscovery discovery(factory);
  std::vector<std::string> names = discovery.listDatabases(project.source);
  std::cout << "=== Databases on " << project.source.host << " ("
            << platformToString(project.source.platform) << ") ===" << std::endl;
  for (const auto &db : names) {
    std::cout << "  " << db << std::endl;
  }
  return EXIT_SUCCESS_CODE;
}

int selectTables(ProjectStore &store,
                 std::shared_ptr<IConnectionFactory> factory,
                 const std::string &name, const std::string &database,
                 const std::string &include, const std::string &exclude) {
  TransferProject project = store.load(name);
  DatabaseDiscovery discovery(factory);

  std::vector<std::string> includePatterns =
      PatternMatcher::parsePatternInput(include);
  std::vector<std::string> excludePatterns =
      PatternMatcher::parsePatternInput(exclude);

  DatabaseDiscovery::TableSelection selection = discovery.selectTables(
      project.source, database, includePatterns, excludePatterns);
  const std::vector<std::string> &tables = selection.selected;
  const std::vector<std::string> &excluded = selection.excluded;

  DatabaseMapping *mapping = nullptr;
  for (auto &db : project.databases) {
    if (StringUtils::equalsIgnoreCase(db.sourceDatabase, database))
      mapping = &db;
  }
  if (!mapping) {
    project.databases.push_back(DatabaseMapping{database, database, {}, {}});
    mapping = &project.databases.back();
  }
  mapping->tables = tables;
  mapping->excludedTables = excluded;

  if (tables.empty()) {
    std::cerr << "No tables in " << database << " match the given patterns"
              << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  store.save(project);
  std::cout << "Selected " << tables.size() << " tables in " << database;
  if (!excluded.empty())
    std::cout << " (" << excluded.size() << " excluded)";
  std::cout << std::endl;
  return EXIT_SUCCESS_CODE;
}

int showStatus(ProjectStore &store, TransferEngine &engine,
               const std::string &name) {
  if (!store.exists(name)) {
    std::cerr << "Project '" << name << "' not found" << std::endl;
    return EXIT_CONFIG_ERROR;
  }
  ConsoleView::printState(std::cout, "Full transfer",
                          engine.status(name, TransferPhase::FULL));
  ConsoleView::printState(std::cout, "Extract",
                          engine.status(name, TransferPhase::EXTRACT));
  ConsoleView::printState(std::cout, "Insert",
                          engine.status(name, TransferPhase::INSERT));
  return EXIT_SUCCESS_CODE;
}

int runProject(ProjectStore &store, TransferEngine &engine,
               const std::string &name, TransferPhase phase, bool autoYes) {
  TransferProject project = store.load(name);
  ConsoleDecisions decisions(std::cin, std::cout, autoYes, g_consoleMutex);

  if (!decisions.confirmStart(project, phase)) {
    std::cout << "Transfer cancelled." << std::endl;
    return EXIT_SUCCESS_CODE;
  }

  {
    std::lock_guard<std::mutex> lock(g_consoleMutex);
    std::cout << "Press Ctrl+C to stop after the running tables complete."
              << std::endl;
  }

  TransferReport report;
  switch (phase) {
  case TransferPhase::EXTRACT:
    report = engine.runExtractOnly(name, decisions);
    break;
  case TransferPhase::INSERT:
    report = engine.runInsertOnly(name, decisions);
    break;
  case TransferPhase::FULL:
  default:
    report = engine.runFull(name, decisions);
    break;
  }

  ConsoleView::printReport(std::cout, report);
  return report.success ? EXIT_SUCCESS_CODE : EXIT_TRANSFER_INCOMPLETE;
}

int dispatch(const std::vector<std::string> &args) {
  const std::string &command = args[0];
  auto store = std::make_shared<ProjectStore>(AppConfig::getSettingsPath());
  auto factory = std::make_shared<OdbcConnectionFactory>();

  auto needs = [&args](size_t count) {
    if (args.size() < count) {
      printUsage();
      return false;
    }
    return true;
  };

  if (command == "list") {
    return listProjects(*store);
  }
  if (command == "show") {
    if (!needs(2))
      return EXIT_USAGE_ERROR;
    ConsoleView::printProject(std::cout, store->load(args[1]));
    return EXIT_SUCCESS_CODE;
  }
  if (command == "delete") {
    if (!needs(2))
      return EXIT_USAGE_ERROR;
    if (!store->remove(args[1])) {
      std::cerr << "Project '" << args[1] << "' not found" << std::endl;
      return EXIT_CONFIG_ERROR;
    }
    std::cout << "Deleted project '" << args[1] << "'" << std::endl;
    return EXIT_SUCCESS_CODE;
  }
  if (command == "import") {
    if (!needs(3))
      return EXIT_USAGE_ERROR;
    return importProject(*store, args[1], args[2]);
  }
  if (command == "databases") {
    if (!needs(2))
      return EXIT_USAGE_ERROR;
    return listSourceDatabases(*store, factory, args[1]);
  }
  if (command == "select-tables") {
    if (!needs(3))
      return EXIT_USAGE_ERROR;
    std::string include;
    std::string exclude;
    for (size_t i = 3; i < args.size(); ++i) {
      if (args[i] == "--include" && i + 1 < args.size()) {
        include = args[++i];
      } else if (args[i] == "--exclude" && i + 1 < args.size()) {
        exclude = args[++i];
      } else {
        printUsage();
        return EXIT_USAGE_ERROR;
      }
    }
    return selectTables(*store, factory, args[1], args[2], include, exclude);
  }

  auto bulkCopy = std::make_shared<FreeBcpRunner>(AppConfig::getBcpCommand());
  TransferEngine engine(store, factory, bulkCopy, AppConfig::getDataDirectory(),
                        AppConfig::getProgressRefreshHz());
  engine.setStopPredicate([]() { return g_shutdownRequested.load(); });
  engine.setProgressRenderer(ConsoleView::makeRenderer(std::cerr, g_consoleMutex));

  if (command == "status") {
    if (!needs(2))
      return EXIT_USAGE_ERROR;
    return showStatus(*store, engine, args[1]);
  }
  if (command == "reset") {
    if (!needs(2))
      return EXIT_USAGE_ERROR;
    engine.resetState(args[1]);
    std::cout << "Transfer state of '" << args[1] << "' cleared" << std::endl;
    return EXIT_SUCCESS_CODE;
  }
  if (command == "run") {
    if (!needs(2))
      return EXIT_USAGE_ERROR;
    TransferPhase phase = TransferPhase::FULL;
    bool autoYes = false;
    for (size_t i = 2; i < args.size(); ++i) {
      if (args[i] == "--extract-only") {
        phase = TransferPhase::EXTRACT;
      } else if (args[i] == "--insert-only") {
        phase = TransferPhase::INSERT;
      } else if (args[i] == "--yes" || args[i] == "-y") {
        autoYes = true;
      } else {
        printUsage();
        return EXIT_USAGE_ERROR;
      }
    }
    return runProject(*store, engine, args[1], phase, autoYes);
  }

  printUsage();
  return EXIT_USAGE_ERROR;
}
} // namespace

int main(int argc, char *argv[]) {
  std::string configPath = "config.json";
  std::string settingsOverride;
  std::string dataDirOverride;
  bool verbose = false;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      configPath = argv[++i];
    } else if (arg == "--settings" && i + 1 < argc) {
      settingsOverride = argv[++i];
    } else if (arg == "--data-dir" && i + 1 < argc) {
      dataDirOverride = argv[++i];
    } else if (arg == "--verbose" || arg == "-v") {
      verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      printUsage();
      return EXIT_SUCCESS_CODE;
    } else {
      args.push_back(arg);
    }
  }
  if (args.empty()) {
    printUsage();
    return EXIT_USAGE_ERROR;
  }

  try {
    try {
      AppConfig::loadFromFile(configPath);
      if (!settingsOverride.empty())
        AppConfig::setSettingsPath(settingsOverride);
      if (!dataDirOverride.empty())
        AppConfig::setDataDirectory(dataDirOverride);
      if (verbose)
        AppConfig::setLogLevel("DEBUG");
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << std::endl;
      return EXIT_CONFIG_ERROR;
    }

    if (!AppConfig::isInitialized()) {
      std::cerr << "Error: configuration failed to initialize. "
                   "Please check "
                << configPath << " or environment variables." << std::endl;
      return EXIT_CONFIG_ERROR;
    }

    Logger::initialize();

    if (std::signal(SIGINT, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register SIGINT handler" << std::endl;
      cleanupLogger();
      return EXIT_SIGNAL_ERROR;
    }

    if (std::signal(SIGTERM, signalHandler) == SIG_ERR) {
      std::cerr << "Error: Failed to register SIGTERM handler" << std::endl;
      cleanupLogger();
      return EXIT_SIGNAL_ERROR;
    }

    Logger::info(LogCategory::SYSTEM, "main",
                 "transfer_data started: " + args[0] + " (settings: " +
                     AppConfig::getSettingsPath() + ")");

    int code = EXIT_SUCCESS_CODE;
    try {
      code = dispatch(args);
    } catch (const ConfigurationError &e) {
      Logger::error(LogCategory::CONFIG, "main", e.what());
      std::cerr << "Configuration error: " << e.what() << std::endl;
      code = EXIT_CONFIG_ERROR;
    } catch (const ConnectionError &e) {
      Logger::error(LogCategory::DATABASE, "main", e.what());
      std::cerr << "Connection error: " << e.what() << std::endl;
      code = EXIT_INIT_ERROR;
    } catch (const std::exception &e) {
      Logger::error(LogCategory::SYSTEM, "main",
                    "Exception during execution: " + std::string(e.what()));
      std::cerr << "Execution error: " << e.what() << std::endl;
      code = EXIT_EXECUTION_ERROR;
    }

    cleanupLogger();
    return code;

  } catch (const std::exception &e) {
    std::cerr << "Critical error in main: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_CRITICAL_ERROR;
  } catch (...) {
    std::cerr << "Unknown critical error in main" << std::endl;
    cleanupLogger();
    return EXIT_UNKNOWN_ERROR;
  }
}
