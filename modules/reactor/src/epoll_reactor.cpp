#include "epoll_reactor.h"
#include "logger.h"
#include <vector>
#include <unordered_map>
#include <map>
#include <mutex>
#include <atomic>
#include <thread>
#include <chrono>
#include <cerrno>
#include <system_error>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <fcntl.h>

struct Timer {
    int id;
    long long expirationMs;
    int intervalMs;
    Task task;
};

static long long nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

class EpollReactorImpl {
public:
    EpollReactorImpl() : m_running(false), m_timerSeq(0) {
        m_epollFd = epoll_create1(EPOLL_CLOEXEC);
        if (m_epollFd < 0) {
            throw std::system_error(errno, std::generic_category(), "epoll_create1");
        }
        m_wakeFd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (m_wakeFd < 0) {
            int err = errno;
            close(m_epollFd);
            throw std::system_error(err, std::generic_category(), "eventfd");
        }

        struct epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = m_wakeFd;
        if (epoll_ctl(m_epollFd, EPOLL_CTL_ADD, m_wakeFd, &ev) < 0) {
            int err = errno;
            close(m_wakeFd);
            close(m_epollFd);
            throw std::system_error(err, std::generic_category(), "epoll_ctl(wake)");
        }
    }

    ~EpollReactorImpl() {
        stop();
        close(m_epollFd);
        close(m_wakeFd);
    }

    void start() {
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        if (m_running) return;
        if (m_thread.joinable()) m_thread.join();
        m_running = true;
        m_thread = std::thread([this]() { loop(); });
        LOG_DEBUG("Reactor: Started");
    }

    void stop() {
        if (std::this_thread::get_id() == m_loopThreadId) {
            m_running = false;
            wakeUp();
            return;
        }
        std::lock_guard<std::mutex> lock(m_lifecycleMutex);
        m_running = false;
        wakeUp();
        if (m_thread.joinable()) {
            m_thread.join();
            LOG_DEBUG("Reactor: Stopped");
        }
    }

    bool isRunning() const { return m_running; }

    void wakeUp() {
        uint64_t u = 1;
        if (write(m_wakeFd, &u, sizeof(u)) < 0 && errno != EAGAIN) {
            LOG_WARN("Reactor: wake write failed, errno=" + std::to_string(errno));
        }
    }

    bool add(int fd, uint32_t events, EventCallback cb) {
        std::lock_guard<std::mutex> lock(m_mutex);
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) return false;

        struct epoll_event ev{};
        ev.events = events;
        ev.data.fd = fd;
        if (epoll_ctl(m_epollFd, EPOLL_CTL_ADD, fd, &ev) < 0) return false;
        m_callbacks[fd] = std::move(cb);
        return true;
    }

    bool remove(int fd) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_callbacks.erase(fd);
        return epoll_ctl(m_epollFd, EPOLL_CTL_DEL, fd, nullptr) == 0;
    }

    void post(Task t) {
        {
            std::lock_guard<std::mutex> lock(m_taskMutex);
            m_pendingTasks.push_back(std::move(t));
        }
        wakeUp();
    }

    int schedule(int ms, int intervalMs, Task t) {
        int id;
        {
            std::lock_guard<std::mutex> lock(m_timerMutex);
            id = ++m_timerSeq;
            Timer timer{id, nowMs() + ms, intervalMs, std::move(t)};
            m_timers.emplace(timer.expirationMs, std::move(timer));
        }
        wakeUp();
        return id;
    }

private:
    void loop() {
        m_loopThreadId = std::this_thread::get_id();
        const int MAX_EVENTS = 64;
        struct epoll_event events[MAX_EVENTS];

        while (m_running) {
            int timeout = -1;
            {
                std::lock_guard<std::mutex> lock(m_timerMutex);
                if (!m_timers.empty()) {
                    long long now = nowMs();
                    long long next = m_timers.begin()->first;
                    timeout = (next > now) ? static_cast<int>(next - now) : 0;
                }
            }

            int n = epoll_wait(m_epollFd, events, MAX_EVENTS, timeout);
            if (n < 0 && errno != EINTR) {
                LOG_ERROR("Reactor: epoll_wait failed, errno=" + std::to_string(errno));
                m_running = false;
                break;
            }

            for (int i = 0; i < n; ++i) {
                int fd = events[i].data.fd;
                if (fd == m_wakeFd) {
                    uint64_t u;
                    while (read(m_wakeFd, &u, sizeof(u)) > 0) {}
                    continue;
                }
                EventCallback cb;
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    auto it = m_callbacks.find(fd);
                    if (it != m_callbacks.end()) cb = it->second;
                }
                if (cb) cb(fd, events[i].events);
            }

            std::vector<Task> tasks;
            {
                std::lock_guard<std::mutex> lock(m_taskMutex);
                tasks.swap(m_pendingTasks);
            }
            for (auto& t : tasks) t();

            runDueTimers();
        }
    }

    void runDueTimers() {
        const long long now = nowMs();
        std::unique_lock<std::mutex> lock(m_timerMutex);
        while (!m_timers.empty() && m_timers.begin()->first <= now) {
            Timer t = std::move(m_timers.begin()->second);
            m_timers.erase(m_timers.begin());

            // Tasks may add timers themselves
            lock.unlock();
            if (t.task) t.task();
            lock.lock();

            if (t.intervalMs > 0) {
                t.expirationMs = now + t.intervalMs;
                m_timers.emplace(t.expirationMs, std::move(t));
            }
        }
    }

    int m_epollFd, m_wakeFd;
    std::atomic<bool> m_running;
    std::mutex m_lifecycleMutex;
    std::thread m_thread;
    std::atomic<std::thread::id> m_loopThreadId{};
    std::mutex m_mutex;
    std::unordered_map<int, EventCallback> m_callbacks;
    std::mutex m_taskMutex;
    std::vector<Task> m_pendingTasks;
    std::mutex m_timerMutex;
    std::multimap<long long, Timer> m_timers;
    int m_timerSeq;
};

EpollReactor::EpollReactor() : m_impl(std::make_unique<EpollReactorImpl>()) {}
EpollReactor::~EpollReactor() = default;
void EpollReactor::start() { m_impl->start(); }
void EpollReactor::stop() { m_impl->stop(); }
bool EpollReactor::is_running() const { return m_impl->isRunning(); }
bool EpollReactor::add(int fd, uint32_t events, EventCallback cb) { return m_impl->add(fd, events, std::move(cb)); }
bool EpollReactor::remove(int fd) { return m_impl->remove(fd); }
void EpollReactor::post(Task t) { m_impl->post(std::move(t)); }
TimerId EpollReactor::runEvery(int ms, Task t) { return m_impl->schedule(ms, ms, std::move(t)); }
