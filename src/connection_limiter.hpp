/*
Connection limiting
Every (peer, direction) pair owns a pool of permits. A transfer holds one
permit from before its rsync process starts until the output is drained, so
at most `capacity` connections to one peer run in the same direction while
other peers and the opposite direction are not affected.
*/

#ifndef CONNECTION_LIMITER_HPP
#define CONNECTION_LIMITER_HPP

#include "sync_task.hpp"

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

// A counting permit pool
class PermitPool {
public:
    explicit PermitPool(size_t capacity)
        : m_capacity(capacity), m_available(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("PermitPool capacity must be positive");
        }
    }

    // Block until a permit is free and take it
    void acquire() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_released.wait(lock, [this] { return m_available > 0; });
        --m_available;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_available;
        }
        m_released.notify_one();
    }

    size_t available() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_available;
    }

    size_t capacity() const { return m_capacity; }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_released;
    const size_t m_capacity;
    size_t m_available;
};

// Holds one permit for its lifetime
class Permit {
public:
    explicit Permit(PermitPool& pool) : m_pool(pool) {
        m_pool.acquire();
    }

    ~Permit() {
        m_pool.release();
    }

    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;

private:
    PermitPool& m_pool;
};

// Permit pools keyed by (peer, direction), created on first use
class ConnectionLimiter {
public:
    explicit ConnectionLimiter(size_t capacity) : m_capacity(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("concurrency limit must be positive");
        }
    }

    std::shared_ptr<PermitPool> pool(const std::string& host, Direction direction) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& entry = m_pools[{host, direction}];
        if (!entry) {
            entry = std::make_shared<PermitPool>(m_capacity);
        }
        return entry;
    }

    size_t capacity() const { return m_capacity; }

private:
    const size_t m_capacity;
    std::mutex m_mutex;
    std::map<std::pair<std::string, Direction>, std::shared_ptr<PermitPool>> m_pools;
};

#endif // CONNECTION_LIMITER_HPP
