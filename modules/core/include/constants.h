#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <cstddef>
#include <cstdint>

constexpr const char* NODELINK_VERSION = "0.2.0";

// Network Configuration
constexpr uint16_t DEFAULT_TRANSFER_PORT = 7879;
constexpr uint16_t DISCOVERY_PORT = 54321;
constexpr const char* DISCOVERY_MULTICAST_GROUP = "239.255.42.99";
constexpr int DEFAULT_LISTEN_BACKLOG = 64;

// Discovery timing (milliseconds)
constexpr int DISCOVERY_ANNOUNCE_INTERVAL_MS = 5000;
constexpr int DISCOVERY_STALENESS_TIMEOUT_MS = 15000;
constexpr int DISCOVERY_SWEEP_INTERVAL_MS = 1000;
constexpr int DISCOVERY_RETRY_INTERVAL_MS = 5000;

// Transfer
constexpr uint32_t DEFAULT_CHUNK_SIZE = 1024 * 1024;
constexpr uint32_t DEFAULT_CONCURRENT_STREAMS = 4;
constexpr uint32_t MAX_STREAMS_PER_TRANSFER = 256;
constexpr uint32_t DEFAULT_BUFFER_POOL_SIZE = 8;
constexpr int DEFAULT_MAX_STREAM_RETRIES = 3;
constexpr int DEFAULT_RETRY_BACKOFF_MS = 200;
constexpr int DEFAULT_IO_TIMEOUT_MS = 10000;
constexpr int DEFAULT_SESSION_TIMEOUT_MS = 60000;
constexpr int DEFAULT_PROGRESS_INTERVAL_MS = 100;
constexpr int DEFAULT_VERIFY_TIMEOUT_MS = 120000;
constexpr int DEFAULT_SESSION_RETENTION_MS = 30000;
constexpr uint32_t DEFAULT_CHECKPOINT_INTERVAL_CHUNKS = 8;

// RDMA
constexpr int DEFAULT_RDMA_COOLDOWN_MS = 300000;

#endif // CONSTANTS_H
