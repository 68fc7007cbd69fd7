#pragma once

#include <algorithm>
#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace nbt {
namespace parallel {

// =============================================================================
// blocking_queue - unbounded, many producers; recv() waits for an item
// =============================================================================

template<typename T>
class blocking_queue {
public:
    void send(T item) {
        auto lock = std::lock_guard<std::mutex>(mutex_);
        items_.push_back(std::move(item));
        ready_.notify_one();
    }

    auto recv() -> T {
        auto lock = std::unique_lock<std::mutex>(mutex_);
        ready_.wait(lock, [this] { return !items_.empty(); });
        auto item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

private:
    std::deque<T> items_;
    std::mutex mutex_;
    std::condition_variable ready_;
};

// =============================================================================
// Schedulers
// =============================================================================

// Anything that accepts void() tasks, running them inline or elsewhere.
template<typename S>
concept Scheduler = requires(S& s, std::function<void()> task) {
    s.spawn(std::move(task));
};

// Runs each task to completion inside spawn().
class sequential_scheduler_t {
public:
    template<typename F>
    void spawn(F&& task) {
        std::forward<F>(task)();
    }
};

// Fixed set of workers draining one shared task list. Destruction finishes
// every queued task, then joins.
class thread_pool_t {
public:
    explicit thread_pool_t(std::size_t num_threads) {
        auto n = std::max<std::size_t>(num_threads, 1);
        workers_.reserve(n);
        while (workers_.size() < n) {
            workers_.emplace_back(&thread_pool_t::run, this);
        }
    }

    ~thread_pool_t() {
        {
            auto lock = std::lock_guard<std::mutex>(mutex_);
            stopping_ = true;
        }
        wake_.notify_all();
        for (auto& worker : workers_) {
            worker.join();
        }
    }

    thread_pool_t(const thread_pool_t&) = delete;
    thread_pool_t& operator=(const thread_pool_t&) = delete;

    // std::function needs a copyable target, so the task lives behind a
    // shared_ptr.
    template<typename F>
    void spawn(F&& task) {
        auto shared = std::make_shared<std::decay_t<F>>(std::forward<F>(task));
        {
            auto lock = std::lock_guard<std::mutex>(mutex_);
            pending_.emplace_back([shared] { (*shared)(); });
        }
        wake_.notify_one();
    }

    auto size() const -> std::size_t { return workers_.size(); }

private:
    void run() {
        while (true) {
            auto task = std::function<void()>{};
            {
                auto lock = std::unique_lock<std::mutex>(mutex_);
                wake_.wait(lock, [this] { return stopping_ || !pending_.empty(); });
                if (pending_.empty()) {
                    return;
                }
                task = std::move(pending_.front());
                pending_.pop_front();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> pending_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
};

} // namespace parallel
} // namespace nbt
