#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

// Local-only telemetry.
// - Counters: monotonically increasing
// - Gauges: last-set values
// - Histograms: count/sum/min/max
// - Progress: last reported event per transfer
//
// Flushed as a single-line JSON blob (LOG + optional file append).

struct ProgressEvent {
    std::string transfer_id;
    uint64_t bytes = 0;
    uint64_t total = 0;
    double elapsed_s = 0.0;
    double throughput_mbps = 0.0;
};

class Telemetry final {
public:
    struct Config {
        bool enabled = true;
        bool log_json = true;
        int flush_interval_ms = 30000;
        std::string file_path;         // optional (append JSONL)
    };

    static Telemetry& getInstance();

    // Idempotent; safe to call multiple times.
    void initialize(const std::string& node_id, const Config& cfg);
    bool is_enabled() const { return m_enabled.load(std::memory_order_acquire); }

    // Called from a periodic timer.
    void tick();

    void flush(const std::string& reason);

    // No side effects; does not log or write to file.
    std::string snapshot_json(const std::string& reason = "snapshot");

    void inc_counter(const std::string& name, int64_t delta = 1);
    void set_gauge(const std::string& name, int64_t value);
    void observe_hist_ms(const std::string& name, int64_t ms);

    void record_progress(const ProgressEvent& event);
    // Drops the progress entry once a transfer reaches a terminal state.
    void clear_progress(const std::string& transfer_id);

    int64_t counter_value(const std::string& name) const;
    int64_t gauge_value(const std::string& name) const;

private:
    Telemetry() = default;
    ~Telemetry() = default;
    Telemetry(const Telemetry&) = delete;
    Telemetry& operator=(const Telemetry&) = delete;

    struct Counter { std::atomic<int64_t> v{0}; };
    struct Gauge { std::atomic<int64_t> v{0}; };
    struct Hist {
        std::atomic<int64_t> count{0};
        std::atomic<int64_t> sum{0};
        std::atomic<int64_t> min{INT64_MAX};
        std::atomic<int64_t> max{INT64_MIN};
    };

    Counter* get_or_create_counter_(const std::string& name);
    Gauge* get_or_create_gauge_(const std::string& name);
    Hist* get_or_create_hist_(const std::string& name);

    std::string build_flush_json_(const std::string& reason);
    void append_to_file_(const std::string& line);

    std::atomic<bool> m_enabled{false};
    std::atomic<bool> m_log_json{true};
    std::atomic<int> m_flush_interval_ms{30000};
    std::atomic<int64_t> m_start_ms{0};
    std::atomic<int64_t> m_last_flush_ms{0};

    mutable std::mutex m_mu;
    std::string m_node_id;
    std::string m_file_path;

    std::unordered_map<std::string, Counter> m_counters;
    std::unordered_map<std::string, Gauge> m_gauges;
    std::unordered_map<std::string, Hist> m_hists;
    std::unordered_map<std::string, ProgressEvent> m_progress;
};
