#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

// Runs a blocking body on its own thread and waits for it with a deadline.
// A body that misses the deadline keeps running; its thread is parked and
// joined later by reap() or join_all(), never detached.
class TimedRunner {
public:
    TimedRunner() = default;
    ~TimedRunner() { join_all(); }

    TimedRunner(const TimedRunner&) = delete;
    TimedRunner& operator=(const TimedRunner&) = delete;

    // Returns the body's result, or nullopt when the deadline passed first.
    template <typename T>
    std::optional<T> run(std::chrono::milliseconds timeout, std::function<T()> body) {
        reap();

        auto finished = std::make_shared<std::atomic<bool>>(false);
        std::packaged_task<T()> task(std::move(body));
        auto result = task.get_future();

        std::jthread worker([task = std::move(task), finished]() mutable {
            task();
            finished->store(true, std::memory_order_release);
        });

        if (result.wait_for(timeout) == std::future_status::ready) {
            worker.join();
            return result.get();
        }

        std::lock_guard lock(mu_);
        stragglers_.push_back({std::move(worker), std::move(finished)});
        return std::nullopt;
    }

    // Joins parked threads whose body has since completed.
    void reap() {
        std::vector<Straggler> done;
        {
            std::lock_guard lock(mu_);
            for (auto it = stragglers_.begin(); it != stragglers_.end();) {
                if (it->finished->load(std::memory_order_acquire)) {
                    done.push_back(std::move(*it));
                    it = stragglers_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& s : done) s.thread.join();
    }

    // Blocks until every parked body has returned.
    void join_all() {
        std::vector<Straggler> all;
        {
            std::lock_guard lock(mu_);
            all.swap(stragglers_);
        }
        for (auto& s : all) {
            if (s.thread.joinable()) s.thread.join();
        }
    }

    size_t pending() const {
        std::lock_guard lock(mu_);
        return stragglers_.size();
    }

private:
    struct Straggler {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    mutable std::mutex mu_;
    std::vector<Straggler> stragglers_;
};
