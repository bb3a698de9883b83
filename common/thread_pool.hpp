#pragma once

// ============================================================
// thread_pool.hpp -- Header-only C++17 resizable thread pool
// ============================================================

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <algorithm>
#include <stdexcept>

// Growing takes effect immediately. Shrinking never interrupts a running
// task: surplus workers exit the next time they go idle.
class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads) : target_(0), live_(0), stop_(false) {
        resize(num_threads);
    }

    ~ThreadPool() {
        shutdown();
    }

    // Queue a callable; tasks run in FIFO order as workers free up
    void post(std::function<void()> task) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("ThreadPool is stopped");
            tasks_.push(std::move(task));
        }
        cv_.notify_one();
    }

    void resize(size_t num_threads) {
        if (num_threads == 0) num_threads = 1;
        std::vector<std::thread> finished;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) return;
            target_ = num_threads;
            while (live_ < target_) {
                ++live_;
                workers_.emplace_back([this] { worker_loop(); });
            }
            collect_exited_locked(finished);
        }
        cv_.notify_all();
        for (auto& t : finished) {
            if (t.joinable()) t.join();
        }
    }

    // Drains already queued tasks, then joins every worker
    void shutdown() {
        std::vector<std::thread> all;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_ && workers_.empty()) return;
            stop_ = true;
            all.swap(workers_);
            exited_.clear();
        }
        cv_.notify_all();
        for (auto& w : all) {
            if (w.joinable() && w.get_id() != std::this_thread::get_id()) w.join();
            else if (w.joinable()) w.detach();
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return target_;
    }

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] {
                    return stop_ || !tasks_.empty() || live_ > target_;
                });
                if (stop_ && tasks_.empty()) return;
                if (!stop_ && live_ > target_) {
                    --live_;
                    exited_.push_back(std::this_thread::get_id());
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    // Moves the thread objects of retired workers out so they can be joined
    // without holding the lock.
    void collect_exited_locked(std::vector<std::thread>& out) {
        for (auto id : exited_) {
            auto it = std::find_if(workers_.begin(), workers_.end(),
                                   [id](const std::thread& t) { return t.get_id() == id; });
            if (it != workers_.end()) {
                out.push_back(std::move(*it));
                workers_.erase(it);
            }
        }
        exited_.clear();
    }

    std::vector<std::thread>          workers_;
    std::vector<std::thread::id>      exited_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex                mutex_;
    std::condition_variable           cv_;
    size_t                            target_;
    size_t                            live_;
    bool                              stop_;
};
