#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace redlight {

// Fixed-size worker pool. Camera pipelines are long-running, so each one
// occupies a worker for its whole run; jobs beyond the pool size wait.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t n) {
        if (n == 0) n = 1;
        workers_.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ~ThreadPool() { shutdown(); }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>> {
        using R = std::invoke_result_t<F, Args...>;
        auto task = std::make_shared<std::packaged_task<R()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_) throw std::runtime_error("ThreadPool stopped");
            q_.emplace([task] { (*task)(); });
        }
        cv_.notify_one();
        return task->get_future();
    }

    // Drains queued jobs, then joins. Safe to call more than once.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (stop_ && workers_.empty()) return;
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();
    }

    std::size_t size() const { return workers_.size(); }

    std::size_t pending() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

private:
    using Task = std::function<void()>;

    void workerLoop() {
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lk(m_);
                cv_.wait(lk, [this] { return stop_ || !q_.empty(); });
                if (stop_ && q_.empty()) return;
                task = std::move(q_.front());
                q_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<Task> q_;
    mutable std::mutex m_;
    std::condition_variable cv_;
    bool stop_ = false;
};

}  // namespace redlight
