#pragma once

// ============================================================
// thread_pool.hpp -- Header-only task scheduler
//
// Serves two roles:
//   - stream scheduler: StreamDriver posts one detached task per
//     stream; a task runs on a later tick than the post() call
//   - I/O pool: FileBlobHandle materialises slices via enqueue()
//
// Tasks are FIFO. A pool of one worker is a strict event loop.
// ============================================================

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads) : stop_(false) {
        if (num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        worker_ids_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] {
                for (;;) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                        if (stop_ && tasks_.empty()) return;
                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }
                    task();
                }
            });
            worker_ids_.push_back(workers_.back().get_id());
        }
    }

    // Drains queued tasks, then joins. Must not run on one of our workers.
    ~ThreadPool() {
        shutdown();
    }

    // Enqueue a callable and return a future for its result.
    // Exceptions thrown by the callable are delivered through the future.
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using RetType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<RetType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<RetType> res = task->get_future();
        push([task]() { (*task)(); });
        return res;
    }

    // Fire-and-forget. The task must not let exceptions escape.
    void post(std::function<void()> task) {
        push(std::move(task));
    }

    // Stops intake; queued tasks still run. From one of our own tasks
    // this only requests the stop: a worker cannot join itself, so the
    // joining is left to an outside shutdown() or the destructor.
    void shutdown() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (on_worker_thread()) return;

        std::unique_lock<std::mutex> join_lock(join_mutex_);
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
    }

    bool stopped() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return stop_;
    }

    size_t size() const { return workers_.size(); }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

private:
    std::vector<std::thread>          workers_;
    std::vector<std::thread::id>      worker_ids_;   // fixed after construction
    std::mutex                        join_mutex_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex                mutex_;
    std::condition_variable           cv_;
    bool                              stop_;

    bool on_worker_thread() const {
        const std::thread::id self = std::this_thread::get_id();
        for (const auto& id : worker_ids_) {
            if (id == self) return true;
        }
        return false;
    }

    void push(std::function<void()> task) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("ThreadPool is stopped");
            tasks_.emplace(std::move(task));
        }
        cv_.notify_one();
    }
};
