#pragma once

/**
 * ThreadPool.hpp
 *
 * Thread pool for transfers and background persistence.
 */

#include "Logger.hpp"

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <atomic>
#include <stdexcept>
#include <type_traits>

namespace surge::core {

/**
 * ThreadPool - FIFO thread pool
 *
 * Features:
 * - Configurable thread count, growable at runtime
 * - Future-based results
 * - Graceful shutdown (queued jobs are drained before the workers exit)
 */
class ThreadPool {
public:
    /**
     * Constructor
     * @param numThreads Number of worker threads (0 = hardware concurrency)
     */
    explicit ThreadPool(size_t numThreads = 0)
        : m_stop(false), m_activeJobs(0) {

        if (numThreads == 0) {
            numThreads = std::thread::hardware_concurrency();
            if (numThreads == 0) numThreads = 4;
        }

        grow(numThreads);
    }

    /**
     * Destructor - waits for all queued jobs to complete
     */
    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_stop = true;
        }

        m_condition.notify_all();

        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /**
     * Submit a task for execution
     * @param f Function to execute
     * @param args Function arguments
     * @return Future for the result
     */
    template<class F, class... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>> {

        using ReturnType = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<ReturnType> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(m_queueMutex);

            if (m_stop) {
                throw std::runtime_error("Cannot submit to stopped ThreadPool");
            }

            m_tasks.emplace([task]() { (*task)(); });
        }

        m_condition.notify_one();
        return result;
    }

    /**
     * Make sure at least `numThreads` workers exist. Never shrinks.
     * @param numThreads Desired minimum worker count
     */
    void grow(size_t numThreads) {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        if (m_stop) {
            return;
        }
        while (m_workers.size() < numThreads) {
            m_workers.emplace_back([this] {
                workerLoop();
            });
        }
    }

    /**
     * Get number of worker threads
     */
    size_t size() const {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        return m_workers.size();
    }

    /**
     * Get number of queued tasks
     */
    size_t pendingTasks() const {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        return m_tasks.size();
    }

    size_t activeJobs() const {
        return m_activeJobs.load();
    }

    bool isIdle() const {
        return pendingTasks() == 0 && activeJobs() == 0;
    }

    /**
     * Wait for all queued and running tasks to complete
     */
    void waitAll() {
        std::unique_lock<std::mutex> lock(m_queueMutex);
        m_idleCondition.wait(lock, [this] {
            return m_tasks.empty() && m_activeJobs == 0;
        });
    }

private:
    void workerLoop() {
        while (true) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);

                m_condition.wait(lock, [this] {
                    return m_stop || !m_tasks.empty();
                });

                if (m_stop && m_tasks.empty()) {
                    return;
                }

                task = std::move(m_tasks.front());
                m_tasks.pop();
                ++m_activeJobs;
            }

            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR("Unhandled exception in pool job: {}", e.what());
            }

            {
                std::unique_lock<std::mutex> lock(m_queueMutex);
                --m_activeJobs;
                if (m_tasks.empty() && m_activeJobs == 0) {
                    m_idleCondition.notify_all();
                }
            }
        }
    }

private:
    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;

    mutable std::mutex m_queueMutex;
    std::condition_variable m_condition;
    std::condition_variable m_idleCondition;

    bool m_stop;
    std::atomic<size_t> m_activeJobs;
};

} // namespace surge::core
