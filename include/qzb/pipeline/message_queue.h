// =============================================================================
// qzbulk - Message Queue
// =============================================================================
// Bounded multi-producer / multi-consumer FIFO used for the job queue and the
// archive write queue.
//
// - push() blocks while the queue is full (backpressure on producers)
// - pop() blocks while the queue is empty
// - interrupt() wakes every blocked caller; from then on pop() returns
//   std::nullopt and push() returns false, permanently
// - drain() hands whatever is left to the owner
//
// Queue messages are tagged unions: a payload alternative plus the Shutdown
// sentinel. Consumers stop when they dequeue their Shutdown.
// =============================================================================

#ifndef QZB_PIPELINE_MESSAGE_QUEUE_H
#define QZB_PIPELINE_MESSAGE_QUEUE_H

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "qzb/common/types.h"

namespace qzb::pipeline {

/// @brief Bounded blocking FIFO with interrupt support.
/// @tparam T Message type (movable)
template <typename T>
class MessageQueue {
public:
    /// @brief Construct with a capacity (at least 1).
    explicit MessageQueue(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {}

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    /// @brief Enqueue a message, blocking while the queue is full.
    /// @return false if the queue was interrupted (the message is dropped)
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [this] { return interrupted_ || items_.size() < capacity_; });
        if (interrupted_) {
            return false;
        }
        items_.push_back(std::move(item));
        notEmpty_.notify_one();
        return true;
    }

    /// @brief Dequeue a message, blocking while the queue is empty.
    /// @return The message, or std::nullopt once the queue is interrupted
    [[nodiscard]] std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return interrupted_ || !items_.empty(); });
        if (interrupted_) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        notFull_.notify_one();
        return item;
    }

    /// @brief Dequeue without blocking.
    [[nodiscard]] std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (interrupted_ || items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        notFull_.notify_one();
        return item;
    }

    /// @brief Remove and return every queued message, interrupted or not.
    /// @note For the owner, once no consumer is left.
    [[nodiscard]] std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> items(std::make_move_iterator(items_.begin()),
                             std::make_move_iterator(items_.end()));
        items_.clear();
        notFull_.notify_all();
        return items;
    }

    /// @brief Wake every blocked caller and refuse further traffic.
    void interrupt() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interrupted_ = true;
        }
        notEmpty_.notify_all();
        notFull_.notify_all();
    }

    [[nodiscard]] bool interrupted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return interrupted_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<T> items_;
    bool interrupted_ = false;
};

// =============================================================================
// Queue Messages
// =============================================================================

/// @brief Job queue message: a job or the worker sentinel.
using JobMessage = std::variant<Job, Shutdown>;

/// @brief Archive queue message: a write or the writer sentinel.
using ArchiveMessage = std::variant<WriteRequest, Shutdown>;

using JobQueue = MessageQueue<JobMessage>;
using ArchiveQueue = MessageQueue<ArchiveMessage>;

}  // namespace qzb::pipeline

#endif  // QZB_PIPELINE_MESSAGE_QUEUE_H
