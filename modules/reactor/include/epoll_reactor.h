#ifndef EPOLL_REACTOR_H
#define EPOLL_REACTOR_H

#include <functional>
#include <memory>
#include <cstdint>

class EpollReactorImpl;

using EventCallback = std::function<void(int fd, uint32_t events)>;
using Task = std::function<void()>;
using TimerId = int;

// Single-threaded event loop over epoll. Callbacks, posted tasks and timers
// all run on the reactor thread. Throws std::system_error if the epoll or
// wake descriptors cannot be created.
class EpollReactor {
public:
    EpollReactor();
    ~EpollReactor();

    void start();
    // Safe to call from a reactor callback; the loop then exits after the
    // current iteration and is joined by the destructor.
    void stop();
    bool is_running() const;

    bool add(int fd, uint32_t events, EventCallback cb);
    bool remove(int fd);
    void post(Task t);

    // Timers live until the reactor is destroyed.
    TimerId runEvery(int milliseconds, Task t);

private:
    std::unique_ptr<EpollReactorImpl> m_impl;
};

#endif // EPOLL_REACTOR_H
