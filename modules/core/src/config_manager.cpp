#include "config_manager.h"
#include "constants.h"
#include "logger.h"
#include <filesystem>
#include <fstream>

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& config_path) {
    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            LOG_ERROR("CFG: Failed to open config file: " + config_path);
            return false;
        }
        json parsed;
        config_file >> parsed;
        if (!parsed.is_object()) {
            LOG_ERROR("CFG: Config root must be an object: " + config_path);
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_config = std::move(parsed);
        }
        LOG_INFO("CFG: Configuration loaded from " + config_path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("CFG: Config loading failed: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& content) {
    try {
        json parsed = json::parse(content);
        if (!parsed.is_object()) {
            LOG_ERROR("CFG: Config root must be an object");
            return false;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = std::move(parsed);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("CFG: Config parsing failed: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::setValueAtPath(const std::vector<std::string>& path, const json& value) {
    if (path.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    json* node = &m_config;
    for (size_t i = 0; i + 1 < path.size(); ++i) {
        json& child = (*node)[path[i]];
        if (!child.is_object()) {
            child = json::object();
        }
        node = &child;
    }
    (*node)[path.back()] = value;
    return true;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = json::object();
}

json ConfigManager::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

template <typename T>
T ConfigManager::valueAt(const char* section, const char* key, const T& fallback) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto sec = m_config.find(section);
    if (sec == m_config.end() || !sec->is_object()) {
        return fallback;
    }
    auto it = sec->find(key);
    if (it == sec->end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        LOG_WARN("CFG: Bad value for " + std::string(section) + "." + key + ": " + e.what());
        return fallback;
    }
}

std::string ConfigManager::getNodeName() const {
    return valueAt<std::string>("node", "name", "nodelink");
}

bool ConfigManager::isDiscoveryEnabled() const {
    return valueAt<bool>("discovery", "enabled", true);
}

int ConfigManager::getDiscoveryPort() const {
    return valueAt<int>("discovery", "port", static_cast<int>(DISCOVERY_PORT));
}

std::string ConfigManager::getMulticastGroup() const {
    return valueAt<std::string>("discovery", "multicast_group", std::string(DISCOVERY_MULTICAST_GROUP));
}

int ConfigManager::getAnnounceInterval() const {
    return valueAt<int>("discovery", "announce_interval_ms", DISCOVERY_ANNOUNCE_INTERVAL_MS);
}

int ConfigManager::getStalenessTimeout() const {
    return valueAt<int>("discovery", "staleness_timeout_ms", DISCOVERY_STALENESS_TIMEOUT_MS);
}

int ConfigManager::getSweepInterval() const {
    return valueAt<int>("discovery", "sweep_interval_ms", DISCOVERY_SWEEP_INTERVAL_MS);
}

int ConfigManager::getDiscoveryRetryInterval() const {
    return valueAt<int>("discovery", "retry_interval_ms", DISCOVERY_RETRY_INTERVAL_MS);
}

bool ConfigManager::shouldSendGoodbye() const {
    return valueAt<bool>("discovery", "send_goodbye", true);
}

int ConfigManager::getTransferPort() const {
    return valueAt<int>("file_transfer", "port", static_cast<int>(DEFAULT_TRANSFER_PORT));
}

uint32_t ConfigManager::getChunkSize() const {
    return valueAt<uint32_t>("file_transfer", "chunk_size", DEFAULT_CHUNK_SIZE);
}

uint32_t ConfigManager::getConcurrentStreams() const {
    return valueAt<uint32_t>("file_transfer", "concurrent_streams", DEFAULT_CONCURRENT_STREAMS);
}

uint32_t ConfigManager::getBufferPoolSize() const {
    return valueAt<uint32_t>("file_transfer", "buffer_pool_size", DEFAULT_BUFFER_POOL_SIZE);
}

std::string ConfigManager::getReceiveDirectory() const {
    const auto fallback = (std::filesystem::temp_directory_path() / "nodelink_files").string();
    return valueAt<std::string>("file_transfer", "receive_dir", fallback);
}

int ConfigManager::getMaxStreamRetries() const {
    return valueAt<int>("file_transfer", "max_stream_retries", DEFAULT_MAX_STREAM_RETRIES);
}

int ConfigManager::getRetryBackoffMs() const {
    return valueAt<int>("file_transfer", "retry_backoff_ms", DEFAULT_RETRY_BACKOFF_MS);
}

int ConfigManager::getIoTimeoutMs() const {
    return valueAt<int>("file_transfer", "io_timeout_ms", DEFAULT_IO_TIMEOUT_MS);
}

int ConfigManager::getSessionTimeoutMs() const {
    return valueAt<int>("file_transfer", "session_timeout_ms", DEFAULT_SESSION_TIMEOUT_MS);
}

int ConfigManager::getProgressIntervalMs() const {
    return valueAt<int>("file_transfer", "progress_interval_ms", DEFAULT_PROGRESS_INTERVAL_MS);
}

int ConfigManager::getVerifyTimeoutMs() const {
    return valueAt<int>("file_transfer", "verify_timeout_ms", DEFAULT_VERIFY_TIMEOUT_MS);
}

int ConfigManager::getSessionRetentionMs() const {
    return valueAt<int>("file_transfer", "session_retention_ms", DEFAULT_SESSION_RETENTION_MS);
}

uint32_t ConfigManager::getCheckpointIntervalChunks() const {
    return valueAt<uint32_t>("file_transfer", "checkpoint_interval_chunks", DEFAULT_CHECKPOINT_INTERVAL_CHUNKS);
}

bool ConfigManager::isRdmaEnabled() const {
    return valueAt<bool>("rdma", "enabled", true);
}

int ConfigManager::getRdmaCooldownMs() const {
    return valueAt<int>("rdma", "cooldown_ms", DEFAULT_RDMA_COOLDOWN_MS);
}

std::string ConfigManager::getLogLevel() const {
    return valueAt<std::string>("logging", "level", "info");
}

bool ConfigManager::isAsyncLogging() const {
    return valueAt<bool>("logging", "async", false);
}

bool ConfigManager::isTelemetryEnabled() const {
    return valueAt<bool>("telemetry", "enabled", true);
}

int ConfigManager::getTelemetryFlushInterval() const {
    return valueAt<int>("telemetry", "flush_interval_ms", 30000);
}

std::string ConfigManager::getTelemetryFilePath() const {
    return valueAt<std::string>("telemetry", "file_path", "");
}
