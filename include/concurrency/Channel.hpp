#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace mpc::concurrency {

// Multi-producer, single-consumer message queue used by workers to report
// back to the thread that owns shared state.
template <typename T>
class Channel {
public:
    void push(T value) {
        {
            std::scoped_lock lock(mutex_);
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    // Takes everything currently queued without blocking.
    std::vector<T> drain() {
        std::scoped_lock lock(mutex_);
        return takeAll();
    }

    // Waits up to timeout for at least one message, then takes everything queued.
    template <typename Rep, typename Period>
    std::vector<T> waitAndDrain(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty(); });
        return takeAll();
    }

    [[nodiscard]] size_t size() const {
        std::scoped_lock lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;

    std::vector<T> takeAll() {
        std::vector<T> out;
        out.reserve(items_.size());
        for (auto& item : items_) out.push_back(std::move(item));
        items_.clear();
        return out;
    }
};

}
