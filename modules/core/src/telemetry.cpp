#include "telemetry.h"

#include "logger.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>

namespace {
int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

template <typename T>
void atomic_update_min(std::atomic<T>& a, T v) {
    T cur = a.load(std::memory_order_relaxed);
    while (v < cur && !a.compare_exchange_weak(cur, v, std::memory_order_relaxed)) {}
}

template <typename T>
void atomic_update_max(std::atomic<T>& a, T v) {
    T cur = a.load(std::memory_order_relaxed);
    while (v > cur && !a.compare_exchange_weak(cur, v, std::memory_order_relaxed)) {}
}
} // namespace

Telemetry& Telemetry::getInstance() {
    static Telemetry t;
    return t;
}

void Telemetry::initialize(const std::string& node_id, const Config& cfg) {
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_node_id = node_id;
        m_file_path = cfg.file_path;
    }

    m_enabled.store(cfg.enabled, std::memory_order_release);
    m_log_json.store(cfg.log_json, std::memory_order_release);
    m_flush_interval_ms.store(cfg.flush_interval_ms, std::memory_order_release);

    const int64_t t = now_ms();
    if (m_start_ms.load(std::memory_order_acquire) == 0) {
        m_start_ms.store(t, std::memory_order_release);
    }
    if (m_last_flush_ms.load(std::memory_order_acquire) == 0) {
        m_last_flush_ms.store(t, std::memory_order_release);
    }
}

void Telemetry::tick() {
    if (!is_enabled()) return;
    const int64_t t = now_ms();
    const int64_t last = m_last_flush_ms.load(std::memory_order_acquire);
    const int interval = m_flush_interval_ms.load(std::memory_order_acquire);
    if (interval <= 0) return;
    if ((t - last) >= interval) {
        int64_t expected = last;
        if (m_last_flush_ms.compare_exchange_strong(expected, t, std::memory_order_acq_rel)) {
            flush("periodic");
        }
    }
}

void Telemetry::flush(const std::string& reason) {
    if (!is_enabled()) return;
    const std::string line = build_flush_json_(reason);
    if (m_log_json.load(std::memory_order_acquire)) {
        LOG_INFO("TELEMETRY " + line);
    }
    append_to_file_(line);
}

std::string Telemetry::snapshot_json(const std::string& reason) {
    if (!is_enabled()) return "{}";
    return build_flush_json_(reason);
}

Telemetry::Counter* Telemetry::get_or_create_counter_(const std::string& name) {
    std::lock_guard<std::mutex> lk(m_mu);
    return &m_counters[name];
}

Telemetry::Gauge* Telemetry::get_or_create_gauge_(const std::string& name) {
    std::lock_guard<std::mutex> lk(m_mu);
    return &m_gauges[name];
}

Telemetry::Hist* Telemetry::get_or_create_hist_(const std::string& name) {
    std::lock_guard<std::mutex> lk(m_mu);
    return &m_hists[name];
}

void Telemetry::inc_counter(const std::string& name, int64_t delta) {
    if (!is_enabled()) return;
    get_or_create_counter_(name)->v.fetch_add(delta, std::memory_order_relaxed);
}

void Telemetry::set_gauge(const std::string& name, int64_t value) {
    if (!is_enabled()) return;
    get_or_create_gauge_(name)->v.store(value, std::memory_order_relaxed);
}

void Telemetry::observe_hist_ms(const std::string& name, int64_t ms) {
    if (!is_enabled()) return;
    auto* h = get_or_create_hist_(name);
    h->count.fetch_add(1, std::memory_order_relaxed);
    h->sum.fetch_add(ms, std::memory_order_relaxed);
    atomic_update_min(h->min, ms);
    atomic_update_max(h->max, ms);
}

void Telemetry::record_progress(const ProgressEvent& event) {
    if (!is_enabled()) return;
    std::lock_guard<std::mutex> lk(m_mu);
    m_progress[event.transfer_id] = event;
}

void Telemetry::clear_progress(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_progress.erase(transfer_id);
}

int64_t Telemetry::counter_value(const std::string& name) const {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_counters.find(name);
    return it == m_counters.end() ? 0 : it->second.v.load(std::memory_order_relaxed);
}

int64_t Telemetry::gauge_value(const std::string& name) const {
    std::lock_guard<std::mutex> lk(m_mu);
    auto it = m_gauges.find(name);
    return it == m_gauges.end() ? 0 : it->second.v.load(std::memory_order_relaxed);
}

std::string Telemetry::build_flush_json_(const std::string& reason) {
    const int64_t t = now_ms();
    const int64_t start = m_start_ms.load(std::memory_order_acquire);

    nlohmann::json out;
    out["ts_ms"] = t;
    out["uptime_ms"] = (start > 0) ? (t - start) : 0;
    out["reason"] = reason;

    nlohmann::json counters = nlohmann::json::object();
    nlohmann::json gauges = nlohmann::json::object();
    nlohmann::json hists = nlohmann::json::object();
    nlohmann::json progress = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lk(m_mu);
        out["node_id"] = m_node_id;
        for (auto& kv : m_counters) {
            counters[kv.first] = kv.second.v.load(std::memory_order_relaxed);
        }
        for (auto& kv : m_gauges) {
            gauges[kv.first] = kv.second.v.load(std::memory_order_relaxed);
        }
        for (auto& kv : m_hists) {
            const int64_t count = kv.second.count.load(std::memory_order_relaxed);
            int64_t min = kv.second.min.load(std::memory_order_relaxed);
            int64_t max = kv.second.max.load(std::memory_order_relaxed);
            if (count == 0 || min == INT64_MAX) min = 0;
            if (count == 0 || max == INT64_MIN) max = 0;
            hists[kv.first] = {
                {"count", count},
                {"sum", kv.second.sum.load(std::memory_order_relaxed)},
                {"min", min},
                {"max", max},
            };
        }
        for (auto& kv : m_progress) {
            progress[kv.first] = {
                {"bytes", kv.second.bytes},
                {"total", kv.second.total},
                {"elapsed_s", kv.second.elapsed_s},
                {"throughput_mbps", kv.second.throughput_mbps},
            };
        }
    }
    out["counters"] = std::move(counters);
    out["gauges"] = std::move(gauges);
    out["hists_ms"] = std::move(hists);
    out["progress"] = std::move(progress);
    return out.dump();
}

void Telemetry::append_to_file_(const std::string& line) {
    std::string path;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        path = m_file_path;
    }
    if (path.empty()) return;

    std::ofstream out(path, std::ios::out | std::ios::app);
    if (!out.is_open()) {
        LOG_WARN("Telemetry: Failed to open telemetry file for append: " + path);
        return;
    }
    out << line << "\n";
    if (!out) {
        LOG_WARN("Telemetry: Failed to append to " + path);
    }
}
