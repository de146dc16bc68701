#ifndef SENSISCAN_UTIL_THREAD_POOL_HPP
#define SENSISCAN_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * @file thread_pool.hpp
 * @brief Fixed set of workers draining a FIFO of file tasks.
 *
 * DESIGN GOALS:
 *   - The worker count bounds how many files are extracted at once.
 *   - discardPending() supports scan cancellation: tasks that have not
 *     started are dropped and their futures report broken_promise.
 *   - The destructor drains whatever is still queued, then joins.
 *
 * USAGE:
 *  @code
 *    sensiscan::util::ThreadPool pool(4);
 *    auto size = pool.enqueue([path] { return std::filesystem::file_size(path); });
 *    size.get();
 *  @endcode
 */

namespace sensiscan {
namespace util {

class ThreadPool
{
public:
    /**
     * @param workerCount Zero means one worker per hardware thread.
     */
    explicit ThreadPool(size_t workerCount = 0)
    {
        if (workerCount == 0) {
            workerCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }
    }

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        wake_.notify_all();
        for (auto &w : workers_) {
            if (w.joinable()) {
                w.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t workerCount() const { return workers_.size(); }

    size_t pending() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    /**
     * @return Future for the callable's result.
     * @throw std::runtime_error once the pool is shutting down.
     */
    template<typename F>
    auto enqueue(F &&fn) -> std::future<typename std::invoke_result<F>::type>
    {
        using Result = typename std::invoke_result<F>::type;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
        std::future<Result> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("ThreadPool: enqueue after shutdown");
            }
            tasks_.emplace_back([task]() { (*task)(); });
        }
        wake_.notify_one();
        return result;
    }

    /**
     * @brief Drop every queued task that has not started yet.
     * @return Number of tasks dropped.
     */
    size_t discardPending()
    {
        std::deque<std::function<void()>> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped.swap(tasks_);
        }
        // The packaged_tasks are released here, outside the lock.
        return dropped.size();
    }

private:
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;

    void workerLoop()
    {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wake_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
                if (tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }
};

} // namespace util
} // namespace sensiscan

#endif // SENSISCAN_UTIL_THREAD_POOL_HPP
