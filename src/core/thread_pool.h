// thread_pool.h
#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

/// Fixed-size worker pool used to bound concurrent chunk fetches.
/// At most num_threads jobs run at once; the rest wait in FIFO order.
class ThreadPool {
public:
    /// Throws std::invalid_argument if num_threads is 0.
    explicit ThreadPool(size_t num_threads);

    /// Runs everything already queued, then joins the workers.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /// Queue a callable. Its result, or the exception it threw, arrives
    /// through the returned future.
    template<typename F>
    auto submit(F&& func) -> std::future<decltype(func())>;

private:
    void enqueue(std::function<void()> job);
    void workerLoop();

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable work_available_;
    bool stopping_ = false;
};

// ── Template implementation ────────────────────────────────────

template<typename F>
auto ThreadPool::submit(F&& func) -> std::future<decltype(func())> {
    using Result = decltype(func());

    // packaged_task is move-only; std::function needs a copyable target.
    auto job = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(func));
    std::future<Result> result = job->get_future();
    enqueue([job] { (*job)(); });
    return result;
}
