#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

using json = nlohmann::json;

class ConfigManager {
public:
    static ConfigManager& getInstance();

    bool loadConfig(const std::string& config_path);
    bool loadFromString(const std::string& content);

    // Overrides (or creates) the value at a nested key path, e.g. {"discovery", "port"}.
    bool setValueAtPath(const std::vector<std::string>& path, const json& value);

    // Drops everything loaded so far; getters return their defaults afterwards.
    void reset();

    json snapshot() const;

    // Node
    std::string getNodeName() const;

    // Discovery
    bool isDiscoveryEnabled() const;
    int getDiscoveryPort() const;
    std::string getMulticastGroup() const;
    int getAnnounceInterval() const;
    int getStalenessTimeout() const;
    int getSweepInterval() const;
    int getDiscoveryRetryInterval() const;
    bool shouldSendGoodbye() const;

    // File transfer
    int getTransferPort() const;
    uint32_t getChunkSize() const;
    uint32_t getConcurrentStreams() const;
    uint32_t getBufferPoolSize() const;
    std::string getReceiveDirectory() const;
    int getMaxStreamRetries() const;
    int getRetryBackoffMs() const;
    int getIoTimeoutMs() const;
    int getSessionTimeoutMs() const;
    int getProgressIntervalMs() const;
    int getVerifyTimeoutMs() const;
    int getSessionRetentionMs() const;
    uint32_t getCheckpointIntervalChunks() const;

    // RDMA
    bool isRdmaEnabled() const;
    int getRdmaCooldownMs() const;

    // Logging
    std::string getLogLevel() const;
    bool isAsyncLogging() const;

    // Telemetry
    bool isTelemetryEnabled() const;
    int getTelemetryFlushInterval() const;
    std::string getTelemetryFilePath() const;

private:
    ConfigManager() = default;

    template <typename T>
    T valueAt(const char* section, const char* key, const T& fallback) const;

    mutable std::mutex m_mutex;
    json m_config = json::object();
};
