#include "cli/console_shell.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

ConsoleDecisions::ConsoleDecisions(std::istream &in, std::ostream &out,
                                   bool autoYes, std::mutex &outputMutex)
    : in_(in), out_(out), autoYes_(autoYes), outputMutex_(outputMutex) {}

std::string ConsoleDecisions::ask(const std::string &prompt) {
  {
    std::lock_guard<std::mutex> lock(outputMutex_);
    out_ << prompt << std::flush;
  }
  std::string line;
  if (!std::getline(in_, line)) {
    return "";
  }
  return StringUtils::toLower(StringUtils::trim(line));
}

ResumeDecision
ConsoleDecisions::onIncompleteRun(const ProjectTransferState &previous) {
  {
    std::lock_guard<std::mutex> lock(outputMutex_);
    out_ << "\n*** Previous transfer was interrupted ***\n";
    out_ << "Started:   " << previous.startedAt << "\n";
    out_ << "Last:      " << previous.lastUpdate << "\n";
    out_ << "Completed: " << previous.countWithStatus(TableStatus::COMPLETED)
         << "/" << previous.tables.size() << " tables\n";
  }
  if (autoYes_)
    return ResumeDecision::RESUME;

  std::string answer = ask("\nResume from where you left off? [Y/n]: ");
  return answer == "n" || answer == "no" ? ResumeDecision::RESTART
                                         : ResumeDecision::RESUME;
}

bool ConsoleDecisions::confirmContinue(const TableOutcome &probe,
                                       size_t remaining, size_t threads) {
  {
    std::lock_guard<std::mutex> lock(outputMutex_);
    out_ << "\n--- First Table Complete ---\n";
    out_ << "Table:    " << probe.pair.key() << "\n";
    out_ << "Status:   " << statusToString(probe.status) << "\n";
    out_ << "Rows:     " << probe.rowsTransferred << "\n";
    out_ << "Source:   " << probe.sourceRows << "\n";
    out_ << "Dest:     " << probe.destRowsAfter << "\n";
    out_ << "Time:     " << StringUtils::formatDuration(probe.elapsedSeconds)
         << "\n";
    if (!probe.error.empty())
      out_ << "Reason:   " << probe.error << "\n";
  }
  if (autoYes_)
    return true;

  std::string answer =
      ask("\nContinue with remaining " + std::to_string(remaining) +
          " tables (" + std::to_string(threads) + " parallel)? [y/N]: ");
  if (answer == "y" || answer == "yes")
    return true;

  std::lock_guard<std::mutex> lock(outputMutex_);
  out_ << "Transfer paused. Run again to resume.\n";
  return false;
}

MismatchDecision ConsoleDecisions::onMismatch(const TableOutcome &outcome) {
  {
    std::lock_guard<std::mutex> lock(outputMutex_);
    out_ << "\nWARNING: Row count mismatch on " << outcome.pair.key() << "\n";
    out_ << "  Source rows:      " << outcome.sourceRows << "\n";
    out_ << "  Destination rows: " << outcome.destRowsAfter << "\n";
    out_ << "  Discrepancy:      " << outcome.discrepancy << "\n";
  }
  if (autoYes_)
    return MismatchDecision::ABORT;

  while (true) {
    std::string answer = ask("[R]etry, [S]kip, [A]bort? ");
    if (answer == "r" || answer == "retry")
      return MismatchDecision::RETRY;
    if (answer == "s" || answer == "skip")
      return MismatchDecision::SKIP;
    if (answer == "a" || answer == "abort" || answer.empty())
      return MismatchDecision::ABORT;
  }
}

bool ConsoleDecisions::confirmStart(const TransferProject &project,
                                    TransferPhase phase) {
  size_t tables = buildWorkList(project).size();
  {
    std::lock_guard<std::mutex> lock(outputMutex_);
    out_ << "\n=== Transfer Summary ===\n";
    out_ << "Project:            " << project.name << "\n";
    out_ << "Phase:              " << phaseToString(phase) << "\n";
    out_ << "Tables to transfer: " << tables << "\n";
    out_ << "Mode:               " << modeToString(project.options.mode)
         << "\n";
    out_ << "Load method:        "
         << loadMethodToString(project.options.loadMethod) << "\n";
    out_ << "Threads:            " << project.options.threads << "\n";
  }
  if (autoYes_)
    return true;

  std::string answer = ask("\nReady to start transfer? [y/N]: ");
  return answer == "y" || answer == "yes";
}

std::string ConsoleView::progressBar(int64_t rowsDone, int64_t rowsTotal,
                                     int width) {
  double percent = 0.0;
  if (rowsTotal > 0) {
    percent = std::min(100.0, 100.0 * static_cast<double>(rowsDone) /
                                  static_cast<double>(rowsTotal));
  }
  int filled = static_cast<int>(width * percent / 100.0);

  std::ostringstream line;
  line << "[" << std::string(filled, '#') << std::string(width - filled, '-')
       << "] " << std::setw(3) << static_cast<int>(percent) << "%   "
       << rowsDone << "/" << rowsTotal << " rows";
  return line.str();
}

ProgressReporter::Renderer ConsoleView::makeRenderer(std::ostream &out,
                                                     std::mutex &outputMutex) {
  return [&out, &outputMutex](const ProgressSnapshot &snapshot) {
    std::ostringstream frame;
    for (const auto &entry : snapshot.tables) {
      if (entry.finished)
        continue;
      frame << "  " << std::left << std::setw(40) << entry.table << std::right
            << progressBar(entry.rowsDone, entry.rowsTotal) << "\n";
    }
    frame << "  finished " << snapshot.finishedCount << "/"
          << snapshot.tables.size() << " tables\n";

    std::lock_guard<std::mutex> lock(outputMutex);
    out << frame.str() << std::flush;
  };
}

void ConsoleView::printProject(std::ostream &out,
                               const TransferProject &project) {
  auto printSide = [&out](const char *label, const ConnectionDescriptor &c) {
    out << label << platformToString(c.platform) << " " << c.host << ":"
        << c.effectivePort() << " as " << c.username << "\n";
  };

  out << "Project: " << project.name << "\n";
  printSide("  Source:      ", project.source);
  printSide("  Destination: ", project.destination);
  out << "  Mode: " << modeToString(project.options.mode)
      << "  Batch: " << project.options.batchSize
      << "  Threads: " << project.options.threads
      << "  Load: " << loadMethodToString(project.options.loadMethod) << "\n";
  for (const auto &db : project.databases) {
    out << "  " << db.sourceDatabase << " -> " << db.destinationName() << " ("
        << db.tables.size() << " tables";
    if (!db.excludedTables.empty())
      out << ", " << db.excludedTables.size() << " excluded";
    out << ")\n";
  }
}

void ConsoleView::printState(std::ostream &out, const std::string &label,
                             const ProjectTransferState &state) {
  if (state.empty()) {
    out << label << ": never run\n";
    return;
  }
  out << label << ": started " << state.startedAt << ", last update "
      << state.lastUpdate << "\n";
  for (const auto &entry : state.tables) {
    out << "  " << std::left << std::setw(40) << entry.key() << std::setw(12)
        << statusToString(entry.status) << std::right << std::setw(12)
        << entry.rowsTransferred;
    if (!entry.error.empty())
      out << "  " << entry.error;
    out << "\n";
  }
}

void ConsoleView::printReport(std::ostream &out, const TransferReport &report) {
  out << "\n" << std::string(50, '=') << "\n";
  out << (report.success ? "TRANSFER COMPLETE" : "TRANSFER NOT COMPLETE")
      << "\n";
  out << std::string(50, '=') << "\n";
  out << report.summaryText();
}
