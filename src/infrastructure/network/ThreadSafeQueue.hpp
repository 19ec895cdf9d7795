#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace netscan::infra {

/**
 * @brief Blocking multi-producer queue.
 *
 * Probe workers push results; the sweep coordinator pops them. The
 * coordinator only pops as many items as it has tasks in flight, so pop()
 * always has a producer to wait for.
 */
template <typename T>
class ThreadSafeQueue {
public:
    void push(T value) {
        std::lock_guard lock(mutex_);
        queue_.push(std::move(value));
        cv_.notify_one();
    }

    /**
     * @brief Waits for the next item.
     */
    T pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty(); });

        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

private:
    std::queue<T> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace netscan::infra
