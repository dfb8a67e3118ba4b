/**
 * @file channel.hpp
 * @brief Unbounded multi-producer queue used between watch mode threads.
 *
 * Senders never block. Receivers block until a value arrives, the channel is closed, or an
 * optional deadline passes. After close() pending values can still be drained.
 */

#ifndef CHANNEL_HPP
#define CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

/**
 * @brief Outcome of a timed receive.
 */
enum class ChannelStatus {
    Value,      ///< A value was received.
    Timeout,    ///< The deadline passed with nothing queued.
    Closed      ///< The channel is closed and empty.
};

template <typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Queues a value.
     *
     * @return bool False if the channel was already closed; the value is dropped.
     */
    bool send(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        cond_.notify_one();
        return true;
    }

    /**
     * @brief Blocks until a value is available.
     *
     * @return std::optional<T> The value, or std::nullopt once closed and drained.
     */
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /**
     * @brief Blocks until a value is available or the deadline passes.
     */
    ChannelStatus receiveUntil(T& out, std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cond_.wait_until(lock, deadline, [this] { return !queue_.empty() || closed_; })) {
            return ChannelStatus::Timeout;
        }
        if (queue_.empty()) {
            return ChannelStatus::Closed;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        return ChannelStatus::Value;
    }

    /**
     * @brief Rejects further sends and wakes every receiver.
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cond_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<T> queue_;
    bool closed_ = false;
};

#endif // CHANNEL_HPP
