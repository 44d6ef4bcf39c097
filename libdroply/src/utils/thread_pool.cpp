#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <chrono>

namespace droply {

static const char* pool_tag() {
    return "ThreadPool";
}

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) { worker_loop(st); });
    }
    Logger::log(LogLevel::Debug, "Started " + std::to_string(threads) + " worker(s)", pool_tag());
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard lock(mtx_);
        closing_ = true;
    }
    cancel_pending();
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    work_cv_.notify_all();
}

void ThreadPool::push(std::string label, std::function<void()> run) {
    std::uint64_t id = 0;
    {
        std::lock_guard lock(mtx_);
        if (closing_) {
            throw std::runtime_error("ThreadPool is shutting down, cannot queue '" + label + "'");
        }
        id = next_id_++;
        queue_.push_back(Job{ id, std::move(label), std::move(run) });
    }
    work_cv_.notify_one();
}

void ThreadPool::worker_loop(const std::stop_token& st) {
    for (;;) {
        Job job;
        {
            std::unique_lock lock(mtx_);
            if (!work_cv_.wait(lock, st, [this] { return !queue_.empty(); })) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        const auto start = std::chrono::steady_clock::now();
        job.run();
        const auto ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
        Logger::log(LogLevel::Debug, "Job #" + std::to_string(job.id) + " (" + job.label + ") took " +
                    std::to_string(ms) + " ms", pool_tag());

        {
            std::lock_guard lock(mtx_);
            --running_;
        }
        idle_cv_.notify_all();
    }
}

std::size_t ThreadPool::cancel_pending() {
    std::deque<Job> dropped;
    {
        std::lock_guard lock(mtx_);
        dropped.swap(queue_);
    }
    idle_cv_.notify_all();
    if (!dropped.empty()) {
        Logger::log(LogLevel::Info, "Cancelled " + std::to_string(dropped.size()) + " queued job(s)", pool_tag());
    }
    // dropping the jobs breaks their promises
    return dropped.size();
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(mtx_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

std::size_t ThreadPool::queued() const {
    std::lock_guard lock(mtx_);
    return queue_.size();
}

std::size_t ThreadPool::running() const {
    std::lock_guard lock(mtx_);
    return running_;
}

} // namespace droply
