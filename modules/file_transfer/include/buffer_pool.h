#ifndef BUFFER_POOL_H
#define BUFFER_POOL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

class BufferPool;

/**
 * Scoped checkout of one pool buffer. Move-only; returns the buffer to the
 * pool on destruction or release(). The pool must outlive its buffers.
 */
class PooledBuffer {
public:
    PooledBuffer() = default;
    ~PooledBuffer() { give_back(); }

    PooledBuffer(PooledBuffer&& other) noexcept;
    PooledBuffer& operator=(PooledBuffer&& other) noexcept;
    PooledBuffer(const PooledBuffer&) = delete;
    PooledBuffer& operator=(const PooledBuffer&) = delete;

    uint8_t* data() const { return m_data; }
    size_t size() const { return m_size; }
    size_t index() const { return m_index; }
    explicit operator bool() const { return m_pool != nullptr; }

    // Throws std::logic_error if the pool no longer counts the buffer as checked out.
    void release();

private:
    friend class BufferPool;
    // Destructor and move-assignment path: logs instead of throwing.
    void give_back() noexcept;

    PooledBuffer(BufferPool* pool, size_t index, uint8_t* data, size_t size)
        : m_pool(pool), m_index(index), m_data(data), m_size(size) {}

    BufferPool* m_pool = nullptr;
    size_t m_index = 0;
    uint8_t* m_data = nullptr;
    size_t m_size = 0;
};

/**
 * Fixed set of C buffers of S bytes shared by every stream on both sides.
 * An exhausted pool is backpressure, not an error: acquire() parks the caller
 * on a condition variable until a buffer comes back.
 */
class BufferPool {
public:
    BufferPool(size_t capacity, size_t buffer_size);

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    PooledBuffer acquire();
    // Empty buffer on timeout.
    PooledBuffer try_acquire_for(std::chrono::milliseconds timeout);
    // Empty buffer once `cancelled` becomes true.
    PooledBuffer acquire_unless(const std::atomic<bool>& cancelled);

    // Throws std::logic_error if the buffer is not checked out.
    void release(size_t index);

    size_t capacity() const { return m_capacity; }
    size_t buffer_size() const { return m_buffer_size; }
    size_t available() const;
    size_t outstanding() const;
    size_t peak_outstanding() const;

private:
    friend class PooledBuffer;
    bool check_in(size_t index) noexcept;
    PooledBuffer take_locked();

    const size_t m_capacity;
    const size_t m_buffer_size;
    std::unique_ptr<uint8_t[]> m_storage;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::vector<size_t> m_free;
    std::vector<bool> m_in_use;
    size_t m_peak = 0;
};

#endif // BUFFER_POOL_H
