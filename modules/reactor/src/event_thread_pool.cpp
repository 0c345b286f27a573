#include "event_thread_pool.h"
#include "logger.h"
#include <algorithm>
#include <functional>
#include <string>

EventThreadPool::EventThreadPool(size_t num_workers)
    : m_num_workers(num_workers > 0 ? num_workers
                                    : std::max(1u, std::thread::hardware_concurrency())),
      m_queues(m_num_workers),
      m_queue_mutexes(m_num_workers),
      m_queue_cvs(m_num_workers),
      m_running(true) {
    for (size_t i = 0; i < m_num_workers; ++i) {
        m_workers.emplace_back([this, i] { worker_loop(i); });
    }
}

EventThreadPool::~EventThreadPool() {
    shutdown(true);
}

bool EventThreadPool::submit(const std::string& key, Task task) {
    if (!m_running) return false;
    enqueue(get_worker_id(key), std::move(task));
    return true;
}

void EventThreadPool::enqueue(size_t worker_id, Task task) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutexes[worker_id]);
        m_queues[worker_id].push(std::move(task));
    }
    m_queue_cvs[worker_id].notify_one();
}

void EventThreadPool::shutdown(bool blocking) {
    if (m_running.exchange(false)) {
        for (size_t i = 0; i < m_num_workers; ++i) {
            // Lock so a worker cannot miss the wakeup between its check and wait
            std::lock_guard<std::mutex> lock(m_queue_mutexes[i]);
            m_queue_cvs[i].notify_all();
        }
    }

    if (blocking) {
        for (auto& worker : m_workers) {
            if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
                worker.join();
            }
        }
    }
}

void EventThreadPool::worker_loop(size_t worker_id) {
    for (;;) {
        std::unique_lock<std::mutex> lock(m_queue_mutexes[worker_id]);
        m_queue_cvs[worker_id].wait(lock, [this, worker_id] {
            return !m_queues[worker_id].empty() || !m_running;
        });

        if (m_queues[worker_id].empty()) {
            break;
        }

        Task task = std::move(m_queues[worker_id].front());
        m_queues[worker_id].pop();
        lock.unlock();

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Pool: task failed on worker " + std::to_string(worker_id) + ": " + e.what());
        }
    }
}

size_t EventThreadPool::get_worker_id(const std::string& key) const {
    size_t hash_val = 0;
    for (char c : key) {
        hash_val = hash_val * 31 + static_cast<unsigned char>(c);
    }
    return hash_val % m_num_workers;
}
