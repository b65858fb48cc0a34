// channel.h - Cross-thread queues used by the runtime
// MessageChannel: many producers, one consumer, unbounded, FIFO per producer.
// OneShot: a value that can be taken out exactly once.
//
// This is a header-only implementation to avoid build complexity.

#ifndef WEBSHELL_CHANNEL_H
#define WEBSHELL_CHANNEL_H

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace webshell {

template<typename T>
class MessageChannel {
public:
    MessageChannel() = default;
    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    // Returns false once the consumer has closed the channel; the item is dropped
    bool send(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        condition_.notify_one();
        return true;
    }

    std::optional<T> tryRecv() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Blocks until an item is queued, wakeUp() is called or the channel is closed
    // Returns false if the channel is closed
    bool wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        condition_.wait(lock, [this] { return !items_.empty() || woken_ || closed_; });
        woken_ = false;
        return !closed_;
    }

    void wakeUp() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            woken_ = true;
        }
        condition_.notify_one();
    }

    // Rejects further sends and destroys everything still queued
    void close() {
        std::deque<T> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            dropped.swap(items_);
        }
        condition_.notify_all();
        // dropped items are destroyed here, outside the lock
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<T> items_;
    bool woken_ = false;
    bool closed_ = false;
};

template<typename T>
class OneShot {
public:
    explicit OneShot(T value) : value_(std::move(value)) {}
    OneShot(const OneShot&) = delete;
    OneShot& operator=(const OneShot&) = delete;

    // The first call returns the value, every later call returns nullopt
    std::optional<T> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<T> result;
        result.swap(value_);
        return result;
    }

    bool taken() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return !value_.has_value();
    }

private:
    mutable std::mutex mutex_;
    std::optional<T> value_;
};

} // namespace webshell

#endif // WEBSHELL_CHANNEL_H
