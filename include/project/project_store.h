#ifndef PROJECT_STORE_H
#define PROJECT_STORE_H

#include "project/transfer_project.h"
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Whole-document persistence of transfer projects inside the shared
// settings file. Projects live under the "data_transfer" section; every other
// top-level section of the document is carried through untouched.
//
// Every mutation is a read-modify-write of the complete document under one
// mutex, written to a temp file in the same directory and renamed over the
// original. Read problems raise ConfigurationError, write problems raise
// PersistenceError; in both cases the file on disk is left as it was.
class ProjectStore {
public:
  explicit ProjectStore(std::string settingsPath);

  ProjectStore(const ProjectStore &) = delete;
  ProjectStore &operator=(const ProjectStore &) = delete;

  // Throws ConfigurationError when the project is missing or malformed.
  TransferProject load(const std::string &name) const;
  bool exists(const std::string &name) const;
  // Replaces the configuration keys, keeps any state sections.
  void save(const TransferProject &project);
  bool remove(const std::string &name);
  std::vector<std::string> list() const;

  std::optional<nlohmann::ordered_json>
  readSection(const std::string &project, const std::string &key) const;
  void writeSection(const std::string &project, const std::string &key,
                    const nlohmann::ordered_json &value);
  void removeSection(const std::string &project, const std::string &key);

  const std::string &path() const { return settingsPath_; }

private:
  nlohmann::ordered_json readDocumentUnlocked() const;
  void writeDocumentUnlocked(const nlohmann::ordered_json &document) const;

  std::string settingsPath_;
  mutable std::mutex documentMutex_;
};

#endif
