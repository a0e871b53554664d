#include "project/project_store.h"
#include "core/logger.h"
#include "core/transfer_defaults.h"
#include "core/transfer_errors.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <unistd.h>

using json = nlohmann::ordered_json;

ProjectStore::ProjectStore(std::string settingsPath)
    : settingsPath_(std::move(settingsPath)) {}

json ProjectStore::readDocumentUnlocked() const {
  std::error_code ec;
  if (!std::filesystem::exists(settingsPath_, ec)) {
    return json::object();
  }

  std::ifstream file(settingsPath_);
  if (!file.is_open()) {
    throw ConfigurationError("Cannot open settings file '" + settingsPath_ +
                             "': " + std::strerror(errno));
  }

  json document;
  try {
    file >> document;
  } catch (const json::exception &e) {
    throw ConfigurationError("Settings file '" + settingsPath_ +
                             "' is not valid JSON: " + e.what());
  }
  if (!document.is_object()) {
    throw ConfigurationError("Settings file '" + settingsPath_ +
                             "' must contain a JSON object");
  }
  return document;
}

void ProjectStore::writeDocumentUnlocked(const json &document) const {
  std::filesystem::path target(settingsPath_);
  std::filesystem::path tempPath = target;
  tempPath += ".tmp." + std::to_string(::getpid());

  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
  }

  {
    std::ofstream out(tempPath, std::ios::trunc);
    if (!out.is_open()) {
      throw PersistenceError("Cannot create '" + tempPath.string() +
                             "': " + std::strerror(errno));
    }
    out << document.dump(4) << '\n';
    out.flush();
    if (!out.good()) {
      out.close();
      std::filesystem::remove(tempPath, ec);
      throw PersistenceError("Failed writing '" + tempPath.string() + "'");
    }
  }

  std::filesystem::rename(tempPath, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tempPath, ignored);
    throw PersistenceError("Cannot replace '" + settingsPath_ +
                           "': " + ec.message());
  }
}

TransferProject ProjectStore::load(const std::string &name) const {
  json document;
  {
    std::lock_guard<std::mutex> lock(documentMutex_);
    document = readDocumentUnlocked();
  }

  const char *section = TransferDefaults::PROJECTS_SECTION;
  if (!document.contains(section) || !document[section].is_object() ||
      !document[section].contains(name)) {
    throw ConfigurationError("Project '" + name + "' not found in " +
                             settingsPath_);
  }

  TransferProject project = projectFromJson(name, document[section][name]);
  validateProject(project);
  return project;
}

bool ProjectStore::exists(const std::string &name) const {
  std::lock_guard<std::mutex> lock(documentMutex_);
  json document = readDocumentUnlocked();
  const char *section = TransferDefaults::PROJECTS_SECTION;
  return document.contains(section) && document[section].is_object() &&
         document[section].contains(name);
}

void ProjectStore::save(const TransferProject &project) {
  validateProject(project);

  std::lock_guard<std::mutex> lock(documentMutex_);
  json document = readDocumentUnlocked();
  const char *section = TransferDefaults::PROJECTS_SECTION;
  if (!document.contains(section) || !document[section].is_object()) {
    document[section] = json::object();
  }

  json &entry = document[section][project.name];
  if (!entry.is_object()) {
    entry = json::object();
  }
  json config = projectToJson(project);
  for (auto it = config.begin(); it != config.end(); ++it) {
    entry[it.key()] = it.value();
  }

  writeDocumentUnlocked(document);
  Logger::info(LogCategory::PROJECT, "ProjectStore::save",
               "Saved project '" + project.name + "'");
}

bool ProjectStore::remove(const std::string &name) {
  std::lock_guard<std::mutex> lock(documentMutex_);
  json document = readDocumentUnlocked();
  const char *section = TransferDefaults::PROJECTS_SECTION;
  if (!document.contains(section) || !document[section].is_object() ||
      !document[section].contains(name)) {
    return false;
  }

  document[section].erase(name);
  writeDocumentUnlocked(document);
  Logger::info(LogCategory::PROJECT, "ProjectStore::remove",
               "Deleted project '" + name + "'");
  return true;
}

std::vector<std::string> ProjectStore::list() const {
  std::lock_guard<std::mutex> lock(documentMutex_);
  json document = readDocumentUnlocked();
  std::vector<std::string> names;
  const char *section = TransferDefaults::PROJECTS_SECTION;
  if (document.contains(section) && document[section].is_object()) {
    for (auto it = document[section].begin(); it != document[section].end();
         ++it) {
      names.push_back(it.key());
    }
  }
  return names;
}

std::optional<json> ProjectStore::readSection(const std::string &project,
                                              const std::string &key) const {
  std::lock_guard<std::mutex> lock(documentMutex_);
  json document = readDocumentUnlocked();
  const char *section = TransferDefaults::PROJECTS_SECTION;
  if (!document.contains(section) || !document[section].is_object() ||
      !document[section].contains(project)) {
    return std::nullopt;
  }
  const json &entry = document[section][project];
  if (!entry.is_object() || !entry.contains(key)) {
    return std::nullopt;
  }
  return entry[key];
}

void ProjectStore::writeSection(const std::string &project,
                                const std::string &key, const json &value) {
  std::lock_guard<std::mutex> lock(documentMutex_);
  json document = readDocumentUnlocked();
  const char *section = TransferDefaults::PROJECTS_SECTION;
  if (!document.contains(section) || !document[section].contains(project)) {
    throw PersistenceError("Cannot write " + key + ": project '" + project +
                           "' no longer exists in " + settingsPath_);
  }
  document[section][project][key] = value;
  writeDocumentUnlocked(document);
}

void ProjectStore::removeSection(const std::string &project,
                                 const std::string &key) {
  std::lock_guard<std::mutex> lock(documentMutex_);
  json document = readDocumentUnlocked();
  const char *section = TransferDefaults::PROJECTS_SECTION;
  if (!document.contains(section) || !document[section].contains(project)) {
    return;
  }
  json &entry = document[section][project];
  if (!entry.is_object() || !entry.contains(key)) {
    return;
  }
  entry.erase(key);
  writeDocumentUnlocked(document);
}
