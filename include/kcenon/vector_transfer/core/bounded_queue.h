/**
 * @file bounded_queue.h
 * @brief Closable blocking queue with a fixed capacity
 */

#ifndef KCENON_VECTOR_TRANSFER_CORE_BOUNDED_QUEUE_H
#define KCENON_VECTOR_TRANSFER_CORE_BOUNDED_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace kcenon::vector_transfer {

/**
 * @brief Single-lock FIFO connecting one producer task with one consumer
 *
 * push() blocks while the queue is full and pop() blocks while it is empty.
 * close() wakes both sides: further pushes fail, pops drain what is left
 * and then return an empty optional.
 *
 * @tparam T Element type, must be movable
 */
template <typename T>
class bounded_queue {
public:
    /**
     * @brief Construct with capacity
     * @param capacity Maximum number of queued elements (0 is treated as 1)
     */
    explicit bounded_queue(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    bounded_queue(const bounded_queue&) = delete;
    auto operator=(const bounded_queue&) -> bounded_queue& = delete;

    /**
     * @brief Append an element, waiting for free capacity
     * @return false if the queue was closed, the element is dropped
     */
    [[nodiscard]] auto push(T value) -> bool {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Remove the oldest element, waiting for one to arrive
     * @return The element, or empty optional once closed and drained
     */
    [[nodiscard]] auto pop() -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] auto is_closed() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace kcenon::vector_transfer

#endif  // KCENON_VECTOR_TRANSFER_CORE_BOUNDED_QUEUE_H
