#pragma once
#include <cstdint>
#include <chrono>

#define MAX_BULK_SIZE 536870912
#define MAX_MULTI_BULK_LENGTH 1048576
#define READ_BUFFER_SIZE 16384

/// @brief Number of retries to read socket on EINTR
static constexpr uint_fast16_t READ_NUM_RETRY_ON_INT = 3;

/// @brief Number of retries to write socket on EINTR
static constexpr uint_fast16_t WRITE_NUM_RETRY_ON_INT = 3;

/// @brief Default time a closing session waits for its outstanding writes
static constexpr std::chrono::seconds DEFAULT_DRAIN_TIMEOUT = std::chrono::seconds(10);

/// @brief How often the signal watcher checks whether the server already stopped
static constexpr std::chrono::milliseconds SIGNAL_POLL_INTERVAL = std::chrono::milliseconds(100);

/// @brief Metrics update frequency, decrease for more up-to-date metrics, increase to save server resources
static constexpr std::chrono::seconds METRICS_UPDATE_FREQUENCY_SEC = std::chrono::seconds(2);

/// @brief Values of at least this size are stored compressed when compression is enabled
static constexpr size_t MIN_SIZE_TO_COMPRESS = 64;
