#include "transfer_types.h"
#include "config_manager.h"
#include "constants.h"

#include <filesystem>

const char* transfer_state_name(TransferState state) {
    switch (state) {
        case TransferState::PENDING: return "pending";
        case TransferState::NEGOTIATING: return "negotiating";
        case TransferState::IN_PROGRESS: return "in_progress";
        case TransferState::VERIFYING: return "verifying";
        case TransferState::COMPLETED: return "completed";
        case TransferState::FAILED: return "failed";
        case TransferState::RESUMING: return "resuming";
    }
    return "unknown";
}

const char* transfer_error_name(TransferError error) {
    switch (error) {
        case TransferError::NONE: return "none";
        case TransferError::CONNECT_FAILED: return "connect_failed";
        case TransferError::TIMEOUT: return "timeout";
        case TransferError::CHECKSUM_MISMATCH: return "checksum_mismatch";
        case TransferError::IO_ERROR: return "io_error";
        case TransferError::PROTOCOL_ERROR: return "protocol_error";
        case TransferError::CANCELLED: return "cancelled";
        case TransferError::RESUME_UNAVAILABLE: return "resume_unavailable";
        case TransferError::REJECTED: return "rejected";
        case TransferError::RDMA_UNAVAILABLE: return "rdma_unavailable";
    }
    return "unknown";
}

TransferConfig::TransferConfig()
    : chunk_size(DEFAULT_CHUNK_SIZE),
      port(DEFAULT_TRANSFER_PORT),
      receive_dir((std::filesystem::temp_directory_path() / "nodelink_files").string()),
      concurrent_streams(DEFAULT_CONCURRENT_STREAMS),
      buffer_pool_size(DEFAULT_BUFFER_POOL_SIZE),
      max_stream_retries(DEFAULT_MAX_STREAM_RETRIES),
      retry_backoff_ms(DEFAULT_RETRY_BACKOFF_MS),
      io_timeout_ms(DEFAULT_IO_TIMEOUT_MS),
      session_timeout_ms(DEFAULT_SESSION_TIMEOUT_MS),
      progress_interval_ms(DEFAULT_PROGRESS_INTERVAL_MS),
      verify_timeout_ms(DEFAULT_VERIFY_TIMEOUT_MS),
      session_retention_ms(DEFAULT_SESSION_RETENTION_MS),
      checkpoint_interval_chunks(DEFAULT_CHECKPOINT_INTERVAL_CHUNKS),
      rdma_cooldown_ms(DEFAULT_RDMA_COOLDOWN_MS) {}

TransferConfig TransferConfig::from_config_manager() {
    auto& cfg = ConfigManager::getInstance();
    TransferConfig c;
    c.chunk_size = cfg.getChunkSize() > 0 ? cfg.getChunkSize() : DEFAULT_CHUNK_SIZE;
    c.port = static_cast<uint16_t>(cfg.getTransferPort());
    c.receive_dir = cfg.getReceiveDirectory();
    c.concurrent_streams = cfg.getConcurrentStreams();
    c.buffer_pool_size = cfg.getBufferPoolSize() > 0 ? cfg.getBufferPoolSize() : DEFAULT_BUFFER_POOL_SIZE;
    c.max_stream_retries = cfg.getMaxStreamRetries();
    c.retry_backoff_ms = cfg.getRetryBackoffMs();
    c.io_timeout_ms = cfg.getIoTimeoutMs();
    c.session_timeout_ms = cfg.getSessionTimeoutMs();
    c.progress_interval_ms = cfg.getProgressIntervalMs();
    c.verify_timeout_ms = cfg.getVerifyTimeoutMs();
    c.session_retention_ms = cfg.getSessionRetentionMs();
    c.checkpoint_interval_chunks = cfg.getCheckpointIntervalChunks();
    c.rdma_enabled = cfg.isRdmaEnabled();
    c.rdma_cooldown_ms = cfg.getRdmaCooldownMs();
    return c;
}
