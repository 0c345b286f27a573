#include "buffer_pool.h"
#include "logger.h"

#include <stdexcept>
#include <string>

PooledBuffer::PooledBuffer(PooledBuffer&& other) noexcept
    : m_pool(other.m_pool), m_index(other.m_index), m_data(other.m_data), m_size(other.m_size) {
    other.m_pool = nullptr;
    other.m_data = nullptr;
    other.m_size = 0;
}

PooledBuffer& PooledBuffer::operator=(PooledBuffer&& other) noexcept {
    if (this != &other) {
        give_back();
        m_pool = other.m_pool;
        m_index = other.m_index;
        m_data = other.m_data;
        m_size = other.m_size;
        other.m_pool = nullptr;
        other.m_data = nullptr;
        other.m_size = 0;
    }
    return *this;
}

void PooledBuffer::release() {
    if (!m_pool) return;
    BufferPool* pool = m_pool;
    m_pool = nullptr;
    m_data = nullptr;
    m_size = 0;
    pool->release(m_index);
}

void PooledBuffer::give_back() noexcept {
    if (!m_pool) return;
    BufferPool* pool = m_pool;
    m_pool = nullptr;
    m_data = nullptr;
    m_size = 0;
    if (!pool->check_in(m_index)) {
        LOG_ERROR("POOL: Buffer " + std::to_string(m_index) + " was already returned");
    }
}

BufferPool::BufferPool(size_t capacity, size_t buffer_size)
    : m_capacity(capacity > 0 ? capacity : 1),
      m_buffer_size(buffer_size > 0 ? buffer_size : 1),
      m_storage(new uint8_t[m_capacity * m_buffer_size]),
      m_in_use(m_capacity, false) {
    m_free.reserve(m_capacity);
    for (size_t i = m_capacity; i > 0; --i) {
        m_free.push_back(i - 1);
    }
    LOG_DEBUG("POOL: " + std::to_string(m_capacity) + " x " + std::to_string(m_buffer_size) + " bytes");
}

PooledBuffer BufferPool::take_locked() {
    const size_t idx = m_free.back();
    m_free.pop_back();
    m_in_use[idx] = true;
    const size_t out = m_capacity - m_free.size();
    if (out > m_peak) m_peak = out;
    return PooledBuffer(this, idx, m_storage.get() + idx * m_buffer_size, m_buffer_size);
}

PooledBuffer BufferPool::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return !m_free.empty(); });
    return take_locked();
}

PooledBuffer BufferPool::try_acquire_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_cv.wait_for(lock, timeout, [this] { return !m_free.empty(); })) {
        return PooledBuffer();
    }
    return take_locked();
}

PooledBuffer BufferPool::acquire_unless(const std::atomic<bool>& cancelled) {
    std::unique_lock<std::mutex> lock(m_mutex);
    // Cancellation is not signalled through m_cv, so wake up periodically to check it
    while (m_free.empty()) {
        if (cancelled.load()) {
            return PooledBuffer();
        }
        m_cv.wait_for(lock, std::chrono::milliseconds(50));
    }
    if (cancelled.load()) {
        return PooledBuffer();
    }
    return take_locked();
}

void BufferPool::release(size_t index) {
    if (!check_in(index)) {
        throw std::logic_error("BufferPool: release of buffer " + std::to_string(index) +
                               " that is not checked out");
    }
}

bool BufferPool::check_in(size_t index) noexcept {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (index >= m_capacity || !m_in_use[index]) {
            return false;
        }
        m_in_use[index] = false;
        m_free.push_back(index);
    }
    m_cv.notify_one();
    return true;
}

size_t BufferPool::available() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_free.size();
}

size_t BufferPool::outstanding() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_capacity - m_free.size();
}

size_t BufferPool::peak_outstanding() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peak;
}
