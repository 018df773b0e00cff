#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <utility>

namespace posture {

// Capacity-one buffer. push() never blocks and replaces any unread item;
// take() removes the item, waiting up to a timeout for one to arrive.
template <typename T>
class LatestSlot {
public:
    // Returns true when an unread item was overwritten.
    bool push(T item) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped = item_.has_value();
            item_ = std::move(item);
        }
        cv_.notify_one();
        return dropped;
    }

    template <typename Rep, typename Period>
    std::optional<T> take(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return item_.has_value() || closed_; })) {
            return std::nullopt;
        }
        std::optional<T> out = std::move(item_);
        item_.reset();
        return out;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !item_.has_value();
    }

    // Wakes every waiter for good; take() then returns whatever is left
    // without waiting.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<T> item_;
    bool closed_ = false;
};

}  // namespace posture
