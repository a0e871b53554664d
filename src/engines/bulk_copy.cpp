#include "engines/bulk_copy.h"
#include "core/logger.h"
#include "core/transfer_errors.h"
#include "utils/string_utils.h"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

FreeBcpRunner::FreeBcpRunner(std::string command)
    : command_(std::move(command)) {}

int64_t FreeBcpRunner::parseRowsCopied(const std::string &output) {
  std::string lower = StringUtils::toLower(output);
  size_t pos = lower.rfind("rows copied");
  if (pos == std::string::npos)
    return -1;

  size_t end = pos;
  while (end > 0 && std::isspace(static_cast<unsigned char>(lower[end - 1])))
    --end;
  size_t start = end;
  while (start > 0 && std::isdigit(static_cast<unsigned char>(lower[start - 1])))
    --start;
  if (start == end)
    return -1;
  return std::stoll(lower.substr(start, end - start));
}

int64_t FreeBcpRunner::bulkLoad(const ConnectionDescriptor &connection,
                                const std::string &database,
                                const std::string &table,
                                BulkDirection direction,
                                const std::string &dataFile) {
  std::string qualified = database + ".." + table;
  const char *directionArg = direction == BulkDirection::IN ? "in" : "out";

  std::vector<std::string> args;
  args.push_back(command_);
  args.push_back(qualified);
  args.push_back(directionArg);
  args.push_back(dataFile);
  args.push_back("-H");
  args.push_back(connection.host);
  args.push_back("-p");
  args.push_back(std::to_string(connection.effectivePort()));
  args.push_back("-U");
  args.push_back(connection.username);
  args.push_back("-P");
  args.push_back(connection.password);
  args.push_back("-c");
  args.push_back("-t");
  args.push_back("\t");

  std::vector<const char *> argv;
  for (const auto &arg : args) {
    argv.push_back(arg.c_str());
  }
  argv.push_back(nullptr);

  std::string outputPath = dataFile + ".bcp.log";

  Logger::info(LogCategory::TRANSFER, "FreeBcpRunner",
               "Executing " + command_ + " " + directionArg + " for " +
                   qualified);

  pid_t pid = fork();
  if (pid == 0) {
    int fd = open(outputPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd >= 0) {
      dup2(fd, STDOUT_FILENO);
      dup2(fd, STDERR_FILENO);
      close(fd);
    }
    execvp(command_.c_str(), const_cast<char *const *>(argv.data()));
    _exit(127);
  } else if (pid < 0) {
    throw QueryError("Failed to fork " + command_ + ": " +
                     std::strerror(errno));
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw QueryError("waitpid failed for " + command_ + ": " +
                       std::strerror(errno));
    }
  }

  std::string output;
  {
    std::ifstream in(outputPath);
    std::stringstream buffer;
    buffer << in.rdbuf();
    output = buffer.str();
  }
  std::error_code ec;
  std::filesystem::remove(outputPath, ec);

  Logger::debug(LogCategory::TRANSFER, "FreeBcpRunner",
                command_ + " output for " + qualified + ":\n" + output);

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    std::string reason = code == 127 ? command_ + " command not found"
                                     : command_ + " failed with exit code " +
                                           std::to_string(code);
    std::string detail = StringUtils::trim(output);
    if (detail.size() > 200)
      detail = detail.substr(0, 200);
    throw QueryError(reason + (detail.empty() ? "" : ": " + detail));
  }

  int64_t rows = parseRowsCopied(output);
  if (rows < 0) {
    throw QueryError(command_ + " " + directionArg + " for " + qualified +
                     " finished without reporting a row count");
  }
  return rows;
}
