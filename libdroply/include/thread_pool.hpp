/**
 * @file thread_pool.hpp
 * @brief Worker pool behind Droply::submitProcess() and Droply::submitRestore().
 */

#ifndef DROPLY_THREAD_POOL_HPP
#define DROPLY_THREAD_POOL_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace droply {

/**
 * @brief Fixed-size pool of std::jthread workers running labelled jobs in FIFO order.
 *
 * @details A job's result or exception is delivered through its future.
 * Jobs dropped by cancel_pending() or by the destructor before they start
 * leave their futures with std::future_errc::broken_promise. A running job
 * is never interrupted.
 */
class ThreadPool {
public:
    /**
     * @param threads Number of workers. Zero selects one.
     */
    explicit ThreadPool(unsigned threads);

    /// Drops queued jobs, then waits for the running ones.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queues a nullary callable.
     * @param label Shown in log lines, e.g. "process 3 file(s)".
     * @throws std::runtime_error once the pool is shutting down.
     */
    template<class F>
    auto submit(std::string label, F&& f) -> std::future<std::invoke_result_t<F>> {
        using return_type = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        auto future = task->get_future();
        push(std::move(label), [task] { (*task)(); });
        return future;
    }

    /**
     * @brief Drops every job that has not started yet.
     * @return Number of jobs dropped.
     */
    std::size_t cancel_pending();

    /// Blocks until the queue is empty and no job is running.
    void wait_idle();

    [[nodiscard]] std::size_t queued() const;
    [[nodiscard]] std::size_t running() const;
    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    struct Job {
        std::uint64_t id = 0;
        std::string label;
        std::function<void()> run;
    };

    void push(std::string label, std::function<void()> run);
    void worker_loop(const std::stop_token& st);

    mutable std::mutex mtx_;               ///< Protects everything below except workers_
    std::condition_variable_any work_cv_;  ///< Wakes workers on new jobs or stop
    std::condition_variable idle_cv_;      ///< Wakes wait_idle() when a job ends or is dropped
    std::deque<Job> queue_;
    std::size_t running_ = 0;
    std::uint64_t next_id_ = 1;
    bool closing_ = false;
    std::vector<std::jthread> workers_;    ///< Declared last: joined before the state above goes away
};

} // namespace droply

#endif // DROPLY_THREAD_POOL_HPP
