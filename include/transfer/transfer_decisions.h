#ifndef TRANSFER_DECISIONS_H
#define TRANSFER_DECISIONS_H

#include "state/transfer_state.h"
#include "transfer/table_transfer_worker.h"
#include <cstddef>

enum class ResumeDecision { RESUME, RESTART };

enum class MismatchDecision { RETRY, SKIP, ABORT };

// Synchronous questions the coordinator asks the invoking shell. Every call
// is made on the coordinator thread; dispatch of new tables waits for the
// answer while tables already running carry on.
class ITransferDecisions {
public:
  virtual ~ITransferDecisions() = default;

  // A previous run left tables that are not completed.
  virtual ResumeDecision onIncompleteRun(const ProjectTransferState &previous) = 0;

  // The probe table has finished; false ends the run (state is kept).
  virtual bool confirmContinue(const TableOutcome &probe, size_t remaining,
                               size_t threads) = 0;

  virtual MismatchDecision onMismatch(const TableOutcome &outcome) = 0;
};

#endif
