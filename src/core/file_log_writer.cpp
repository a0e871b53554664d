#include "core/file_log_writer.h"
#include <filesystem>
#include <system_error>

FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles < 1 ? 1 : maxBackupFiles),
      bytesWritten_(0) {
  std::error_code ec;
  std::filesystem::path parent = std::filesystem::path(fileName_).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
  }
  if (std::filesystem::exists(fileName_, ec)) {
    bytesWritten_ = static_cast<size_t>(std::filesystem::file_size(fileName_, ec));
  }
  file_.open(fileName_, std::ios::app);
}

// The size is tracked in-process instead of stat-ing the file on every line;
// several writer threads share one FileLogWriter through the Logger.
bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!file_.is_open())
    return false;

  if (maxFileSize_ > 0 && bytesWritten_ >= maxFileSize_) {
    rotateUnlocked();
    if (!file_.is_open())
      return false;
  }

  file_ << formattedMessage << '\n';
  file_.flush();
  bytesWritten_ += formattedMessage.size() + 1;
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

void FileLogWriter::rotateUnlocked() {
  file_.close();

  std::error_code ec;
  std::string oldest = fileName_ + "." + std::to_string(maxBackupFiles_);
  std::filesystem::remove(oldest, ec);

  for (int i = maxBackupFiles_ - 1; i > 0; --i) {
    std::string from = fileName_ + "." + std::to_string(i);
    std::string to = fileName_ + "." + std::to_string(i + 1);
    if (std::filesystem::exists(from, ec)) {
      std::filesystem::rename(from, to, ec);
    }
  }

  if (std::filesystem::exists(fileName_, ec)) {
    std::filesystem::rename(fileName_, fileName_ + ".1", ec);
  }

  file_.open(fileName_, std::ios::app);
  bytesWritten_ = 0;
}
