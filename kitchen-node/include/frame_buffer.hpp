#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>

namespace kitchen {

// Bounded blocking queue between the frame watcher and the evaluation loop.
// After stop(), push() refuses new items and pop() drains what is left.
template <typename T>
class FrameBuffer {
public:
    explicit FrameBuffer(size_t max_items = 4) : max_items_(max_items) {}

    bool push(T item) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_full_.wait(lock, [&] { return queue_.size() < max_items_ || stopped_; });
        if (stopped_) return false;
        queue_.push(std::move(item));
        lock.unlock();
        cv_empty_.notify_one();
        return true;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_empty_.wait(lock, [&] { return !queue_.empty() || stopped_; });
        if (queue_.empty()) return false;
        out = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        cv_full_.notify_one();
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopped_ = true;
        }
        cv_empty_.notify_all();
        cv_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.size();
    }

private:
    size_t max_items_;
    std::queue<T> queue_;
    mutable std::mutex mu_;
    std::condition_variable cv_empty_;
    std::condition_variable cv_full_;
    bool stopped_{false};
};

}  // namespace kitchen
