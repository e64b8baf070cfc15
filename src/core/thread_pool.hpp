#pragma once

/// @file thread_pool.hpp
/// @brief Fixed-size worker pool returning futures.

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace uptime::core
{
    /// @brief Fixed-size pool of worker threads draining a FIFO task queue.
    ///
    /// Tasks still queued when the pool is destroyed are run before the
    /// workers join, so every future handed out by enqueue() becomes ready.
    class ThreadPool
    {
    public:
        /// @param threads Worker count; 0 selects std::thread::hardware_concurrency().
        explicit ThreadPool(std::size_t threads = 0)
        {
            if (threads == 0)
            {
                threads = std::max<std::size_t>(1, std::thread::hardware_concurrency());
            }

            m_workers.reserve(threads);
            for (std::size_t i = 0; i < threads; ++i)
            {
                m_workers.emplace_back([this] {
                    for (;;)
                    {
                        std::function<void()> task;
                        {
                            std::unique_lock<std::mutex> lock(m_queue_mutex);
                            m_condition.wait(lock, [this] { return m_stop || !m_tasks.empty(); });
                            if (m_stop && m_tasks.empty())
                            {
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

        ~ThreadPool()
        {
            {
                std::unique_lock<std::mutex> lock(m_queue_mutex);
                m_stop = true;
            }
            m_condition.notify_all();
            for (std::thread& worker : m_workers)
            {
                worker.join();
            }
        }

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        /// @brief Queue a callable and obtain a future for its result.
        template <class F>
        [[nodiscard]] auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>>
        {
            using R = std::invoke_result_t<F>;

            // std::function needs a copyable target, packaged_task is move-only
            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
            std::future<R> future = task->get_future();
            {
                std::unique_lock<std::mutex> lock(m_queue_mutex);
                m_tasks.emplace([task] { (*task)(); });
            }
            m_condition.notify_one();
            return future;
        }

        [[nodiscard]] std::size_t size() const { return m_workers.size(); }

    private:
        std::vector<std::thread> m_workers;
        std::queue<std::function<void()>> m_tasks;
        std::mutex m_queue_mutex;
        std::condition_variable m_condition;
        bool m_stop = false;
    };

} // namespace uptime::core
