#ifndef CONSOLE_SHELL_H
#define CONSOLE_SHELL_H

#include "project/transfer_project.h"
#include "transfer/progress_reporter.h"
#include "transfer/transfer_decisions.h"
#include "transfer/transfer_report.h"
#include <iostream>
#include <mutex>
#include <string>

// Answers the coordinator's questions on the terminal. With autoYes set no
// prompt is shown: resume, continue after the probe, and abort on mismatch.
// End of input takes the same defaults.
class ConsoleDecisions : public ITransferDecisions {
public:
  ConsoleDecisions(std::istream &in, std::ostream &out, bool autoYes,
                   std::mutex &outputMutex);

  ResumeDecision onIncompleteRun(const ProjectTransferState &previous) override;
  bool confirmContinue(const TableOutcome &probe, size_t remaining,
                       size_t threads) override;
  MismatchDecision onMismatch(const TableOutcome &outcome) override;

  // "Ready to start transfer? [y/N]" before anything runs.
  bool confirmStart(const TransferProject &project, TransferPhase phase);

private:
  std::string ask(const std::string &prompt);

  std::istream &in_;
  std::ostream &out_;
  bool autoYes_;
  std::mutex &outputMutex_;
};

class ConsoleView {
public:
  // "[#####---------------]  25%   250/1000 rows"
  static std::string progressBar(int64_t rowsDone, int64_t rowsTotal,
                                 int width = 20);

  // Renderer for ProgressReporter: one line per running table plus a
  // finished-tables counter, written to out under outputMutex.
  static ProgressReporter::Renderer makeRenderer(std::ostream &out,
                                                 std::mutex &outputMutex);

  static void printProject(std::ostream &out, const TransferProject &project);
  static void printState(std::ostream &out, const std::string &label,
                         const ProjectTransferState &state);
  static void printReport(std::ostream &out, const TransferReport &report);
};

#endif
