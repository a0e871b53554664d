#ifndef BULK_COPY_H
#define BULK_COPY_H

#include "project/transfer_project.h"
#include <cstdint>
#include <string>

enum class BulkDirection { IN, OUT };

class IBulkCopyRunner {
public:
  virtual ~IBulkCopyRunner() = default;

  // Copies dataFile into (IN) or out of (OUT) database..table in bcp
  // character format, tab separated. Returns the row count reported by the
  // tool; throws QueryError when the copy fails.
  virtual int64_t bulkLoad(const ConnectionDescriptor &connection,
                           const std::string &database,
                           const std::string &table, BulkDirection direction,
                           const std::string &dataFile) = 0;
};

// Runs FreeTDS freebcp with a direct host/port connection.
class FreeBcpRunner : public IBulkCopyRunner {
public:
  explicit FreeBcpRunner(std::string command);

  int64_t bulkLoad(const ConnectionDescriptor &connection,
                   const std::string &database, const std::string &table,
                   BulkDirection direction,
                   const std::string &dataFile) override;

  // "13000 rows copied." -> 13000; -1 when no count is present.
  static int64_t parseRowsCopied(const std::string &output);

private:
  std::string command_;
};

#endif
