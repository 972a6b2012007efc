
#include "thread_pool.hpp"

#include <stdexcept>

ThreadPool::ThreadPool() : m_stop(false) {}

ThreadPool::~ThreadPool() {
    stop();
}


void ThreadPool::enqueue(std::function<void()> task) {
    std::unique_lock lock(m_queue_mutex);
    if (m_stop) {
        throw std::runtime_error("enqueue on a stopped ThreadPool");
    }
    m_tasks.push(std::move(task));
    m_condition.notify_one();
}

void ThreadPool::start(size_t num_threads) {
    for (size_t i = 0; i < num_threads; ++i) {
        m_workers.emplace_back([this] {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock lock(m_queue_mutex);
                    m_condition.wait(lock, [this] { return m_stop || !m_tasks.empty(); });
                    if (m_stop && m_tasks.empty()) {
                        return;
                    }
                    task = std::move(m_tasks.front());
                    m_tasks.pop();
                }
                task();
            }
        });
    }
}

void ThreadPool::stop() {
    {
        std::unique_lock lock(m_queue_mutex);
        m_stop = true;
    }
    m_condition.notify_all();
    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}
