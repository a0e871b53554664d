#ifndef TRANSFER_DEFAULTS_H
#define TRANSFER_DEFAULTS_H

#include <cstddef>

namespace TransferDefaults {
constexpr int MSSQL_PORT = 1433;
constexpr int SYBASE_PORT = 5000;

constexpr size_t DEFAULT_BATCH_SIZE = 1000;
constexpr size_t MIN_BATCH_SIZE = 1;
constexpr size_t MAX_BATCH_SIZE = 100000;

constexpr size_t DEFAULT_THREADS = 5;
constexpr size_t MIN_THREADS = 1;
constexpr size_t MAX_THREADS = 20;

constexpr int DEFAULT_PROGRESS_HZ = 4;
constexpr int MIN_PROGRESS_HZ = 2;
constexpr int MAX_PROGRESS_HZ = 4;

// MSSQL rejects INSERT ... VALUES lists longer than this.
constexpr size_t MSSQL_MAX_ROWS_PER_INSERT = 1000;

constexpr int CONNECT_MAX_RETRIES = 3;
constexpr int CONNECT_INITIAL_BACKOFF_MS = 200;
constexpr int BUFFER_SIZE = 4096;

constexpr const char *PROJECTS_SECTION = "data_transfer";
constexpr const char *FULL_STATE_KEY = "TRANSFER_STATE";
constexpr const char *EXTRACT_STATE_KEY = "EXTRACT_STATE";
constexpr const char *INSERT_STATE_KEY = "INSERT_STATE";
} // namespace TransferDefaults

#endif
