#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

#include "debug.hpp"

namespace mailbridge::helpers {

// A bounded set of threads draining a shared queue of operations.
// Blocking mail store work runs here so the protocol loop never waits on I/O.
class worker_pool {
public:
    using operation = std::function<void()>;

    worker_pool(std::size_t threads, std::string name) : name_{std::move(name)} {
        if (threads == 0) {
            threads = 1;
        }
        workers_.reserve(threads);
        for (std::size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this](std::stop_token stop) { work(stop); });
        }
        SYS_DEBUG_FMT("Worker pool '{}' started with {} threads", name_, threads);
    }

    ~worker_pool() {
        for (auto& worker : workers_) {
            worker.request_stop();
        }
        cv_.notify_all();
        // jthread joins on destruction
        workers_.clear();
        SYS_DEBUG_FMT("Worker pool '{}' stopped", name_);
    }

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;

    // Queue a callable; its result (or exception) is delivered through the future
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using result_t = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<result_t()>>(std::forward<F>(fn));
        auto future = task->get_future();
        {
            std::lock_guard lock(mutex_);
            operations_.push([task]() { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    std::size_t size() const { return workers_.size(); }

private:
    void work(std::stop_token stop) {
        while (true) {
            operation op;
            {
                std::unique_lock lock(mutex_);
                if (!cv_.wait(lock, stop, [this] { return !operations_.empty(); })) {
                    // stop requested and nothing queued
                    return;
                }
                op = std::move(operations_.front());
                operations_.pop();
            }
            // packaged_task captures exceptions into the future
            op();
        }
    }

    std::string name_;
    std::queue<operation> operations_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::vector<std::jthread> workers_;
};

} // namespace mailbridge::helpers
