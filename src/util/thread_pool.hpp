#ifndef DOCSHIELD_UTIL_THREAD_POOL_HPP
#define DOCSHIELD_UTIL_THREAD_POOL_HPP

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
 * @brief Fixed-size worker pool. ScanSession runs document extraction on it
 *        so that the control thread only ever applies finished results.
 *
 * Usage Example:
 *  @code
 *    docshield::util::ThreadPool pool(1);
 *    auto digest = pool.enqueue([&bytes] { return hashing::sha256(bytes); });
 *    pool.waitIdle();
 *  @endcode
 */

namespace docshield {
namespace util {

/**
 * @class ThreadPool
 * @brief Jobs run in submission order on the first free worker. With a single
 *        worker that makes execution strictly sequential.
 *
 * The destructor finishes every job already queued before joining.
 */
class ThreadPool
{
public:
    /// @param workerCount 0 means one worker per hardware thread.
    explicit ThreadPool(size_t workerCount = 0)
    {
        if (workerCount == 0) {
            workerCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(workerCount);
        for (size_t i = 0; i < workerCount; ++i) {
            workers_.emplace_back(&ThreadPool::run, this);
        }
    }

    ~ThreadPool()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shuttingDown_ = true;
        }
        jobReady_.notify_all();
        for (std::thread &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t workerCount() const { return workers_.size(); }

    /**
     * @brief Queue @p f(args...) and return a future for its result.
     *
     * An exception thrown by the job surfaces from future::get().
     * @throw std::runtime_error once the pool is being destroyed.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using Result = typename std::invoke_result<F, Args...>::type;

        auto job = std::make_shared<std::packaged_task<Result()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        std::future<Result> future = job->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shuttingDown_) {
                throw std::runtime_error("ThreadPool: enqueue after shutdown");
            }
            jobs_.emplace_back([job] { (*job)(); });
        }
        jobReady_.notify_one();
        return future;
    }

    /// Block until no job is queued or running.
    void waitIdle()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        drained_.wait(lock, [this] { return jobs_.empty() && busy_ == 0; });
    }

private:
    void run()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            jobReady_.wait(lock, [this] { return shuttingDown_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return; // shutting down with nothing left
            }
            std::function<void()> job = std::move(jobs_.front());
            jobs_.pop_front();
            ++busy_;

            lock.unlock();
            job();
            lock.lock();

            if (--busy_ == 0 && jobs_.empty()) {
                drained_.notify_all();
            }
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable jobReady_;
    std::condition_variable drained_;
    bool shuttingDown_ = false;
    size_t busy_ = 0;
};

} // namespace util
} // namespace docshield

#endif // DOCSHIELD_UTIL_THREAD_POOL_HPP
