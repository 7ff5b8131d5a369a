#ifndef TUNNY_LORENZ_PIPELINE_SYMBOLQUEUE_HPP
#define TUNNY_LORENZ_PIPELINE_SYMBOLQUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace tunny::lorenz {

/*
 * Bounded blocking queue between one producer and one consumer.
 * push() waits while full, pop() waits while empty. close() wakes both
 * sides: pushes then fail, pops drain what is left and then return nullopt.
 */
template <typename T>
class SymbolQueue {
public:
    explicit SymbolQueue(std::size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) throw std::invalid_argument("SymbolQueue: capacity must be > 0");
    }

    bool push(T v) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [this] { return queue_.size() < capacity_ || closed_; });
        if (closed_) return false;
        queue_.push_back(v);
        notEmpty_.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) return std::nullopt;
        T v = queue_.front();
        queue_.pop_front();
        notFull_.notify_one();
        return v;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        notFull_.notify_all();
        notEmpty_.notify_all();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    std::deque<T>           queue_;
    std::size_t             capacity_;
    bool                    closed_ = false;
    mutable std::mutex      mutex_;
    std::condition_variable notFull_;
    std::condition_variable notEmpty_;
};

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_PIPELINE_SYMBOLQUEUE_HPP
