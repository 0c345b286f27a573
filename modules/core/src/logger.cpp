#include "logger.h"
#include <mutex>
#include <random>
#include <string>
#include <iostream>
#include <queue>
#include <thread>
#include <memory>
#include <condition_variable>
#include <atomic>
#include <algorithm>
#include <cctype>

namespace {

std::string generate_session_id(size_t len) {
    static const char alphanum[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    std::string tmp_s;
    tmp_s.reserve(len);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> distrib(0, sizeof(alphanum) - 2);

    for (size_t i = 0; i < len; ++i) {
        tmp_s += alphanum[distrib(gen)];
    }
    return tmp_s;
}

std::mutex g_logMutex;
std::string g_sessionId = generate_session_id(8);
std::function<void(const std::string&)> g_logCallback;

std::atomic<LogLevel> g_log_level{LogLevel::INFO};

std::atomic<bool> g_async_logging_enabled(false);
std::queue<std::string> g_log_queue;
std::mutex g_log_queue_mutex;
std::condition_variable g_log_queue_cv;
std::atomic<bool> g_log_thread_running(false);
std::unique_ptr<std::thread> g_log_thread;

void emit(const std::string& line) {
    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        std::cerr << line << std::endl;
        cb = g_logCallback;
    }
    if (cb) {
        cb(line);
    }
}

void async_log_worker() {
    for (;;) {
        std::unique_lock<std::mutex> lock(g_log_queue_mutex);
        g_log_queue_cv.wait(lock, [] { return !g_log_queue.empty() || !g_log_thread_running; });

        if (g_log_queue.empty()) {
            if (!g_log_thread_running) {
                break;
            }
            continue;
        }

        auto msg = std::move(g_log_queue.front());
        g_log_queue.pop();
        lock.unlock();

        // Write without holding the queue lock so producers never wait on stderr
        emit(msg);
    }
}

} // namespace

void setSessionId(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sessionId = session_id;
}

std::string getSessionId() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_sessionId;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_logCallback = std::move(callback);
}

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel get_log_level() {
    return g_log_level.load();
}

LogLevel parse_log_level(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none") return LogLevel::NONE;
    return LogLevel::INFO;
}

void enable_async_logging() {
    std::lock_guard<std::mutex> lock(g_log_queue_mutex);
    if (g_async_logging_enabled) return;

    g_log_thread_running = true;
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
    g_async_logging_enabled = true;
}

void disable_async_logging() {
    std::unique_ptr<std::thread> worker;
    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        if (!g_async_logging_enabled) return;
        g_async_logging_enabled = false;
        g_log_thread_running = false;
        worker = std::move(g_log_thread);
    }
    g_log_queue_cv.notify_all();

    if (worker && worker->joinable()) {
        worker->join();
    }
}

bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

void nativeLog(const std::string& message) {
    std::string log_message = "[" + getSessionId() + "] " + message;

    bool queued = false;
    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        if (g_async_logging_enabled) {
            g_log_queue.push(log_message);
            queued = true;
        }
    }

    if (queued) {
        g_log_queue_cv.notify_one();
    } else {
        emit(log_message);
    }
}
