#ifndef EVENT_THREAD_POOL_H
#define EVENT_THREAD_POOL_H

#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <vector>
#include <functional>
#include <memory>
#include <atomic>
#include <string>

/**
 * Worker pool for blocking jobs that must stay off the reactor thread
 * (whole-file hashing, checkpoint writes).
 * Tasks with the same key land on the same worker and run in submission order.
 */
class EventThreadPool {
public:
    using Task = std::function<void()>;

    /**
     * num_workers: number of worker threads (default: CPU count)
     */
    explicit EventThreadPool(size_t num_workers = 0);
    ~EventThreadPool();

    /**
     * Returns false once the pool is shut down; the task is not run.
     */
    bool submit(const std::string& key, Task task);

    /**
     * Stop accepting work. Workers finish what is already queued.
     * blocking: if true, waits for the workers to exit
     */
    void shutdown(bool blocking = true);

private:
    void enqueue(size_t worker_id, Task task);
    void worker_loop(size_t worker_id);
    size_t get_worker_id(const std::string& key) const;

    size_t m_num_workers;
    std::vector<std::queue<Task>> m_queues;  // One queue per worker
    std::vector<std::mutex> m_queue_mutexes;
    std::vector<std::condition_variable> m_queue_cvs;
    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running;
};

#endif // EVENT_THREAD_POOL_H
