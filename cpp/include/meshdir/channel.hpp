/**
 * @file channel.hpp
 * @brief Bounded, thread-safe FIFO linking nodes and controllers
 *
 * MeshDir - Overlay Content Directory Node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * - Non-blocking send that fails when closed or full
 * - Non-blocking and timed receive
 * - Optional listener invoked after each accepted send; replacing it waits
 *   for calls already in progress
 */

#pragma once

#include "meshdir/node_config.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace meshdir {

/**
 * @brief Outcome of a channel send
 */
enum class SendStatus {
    OK,         ///< Value queued
    CLOSED,     ///< Channel closed, value dropped
    FULL        ///< Channel at capacity, value dropped
};

inline std::string send_status_to_string(SendStatus status) {
    switch (status) {
        case SendStatus::OK: return "OK";
        case SendStatus::CLOSED: return "CLOSED";
        case SendStatus::FULL: return "FULL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Channel - bounded multi-producer queue
 *
 * Closing a channel rejects further sends; values already queued can still
 * be received.
 */
template <typename T>
class Channel {
public:
    /// Called after a value is queued; must not call back into send or set_listener
    using Listener = std::function<void()>;

    explicit Channel(size_t capacity = config::DEFAULT_CHANNEL_CAPACITY)
        : capacity_(capacity)
        , closed_(false)
    {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel&&) = delete;

    /**
     * @brief Queue a value without blocking
     * @param value Value to queue
     * @return OK, or CLOSED / FULL if the value was dropped
     */
    SendStatus try_send(T value) {
        Listener listener;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return SendStatus::CLOSED;
            }
            if (queue_.size() >= capacity_) {
                return SendStatus::FULL;
            }
            queue_.push_back(std::move(value));
            if (listener_) {
                listener = listener_;
                ++listeners_running_;
            }
        }

        cv_.notify_one();
        if (listener) {
            listener();

            std::lock_guard<std::mutex> lock(mutex_);
            if (--listeners_running_ == 0) {
                listeners_idle_.notify_all();
            }
        }
        return SendStatus::OK;
    }

    /**
     * @brief Take the oldest value without blocking
     * @return Value or std::nullopt if empty
     */
    std::optional<T> try_receive() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /**
     * @brief Wait up to timeout for a value
     * @return Value or std::nullopt on timeout or when closed and drained
     */
    std::optional<T> receive_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return capacity_; }

    /**
     * @brief Replace the listener
     *
     * Returns once no call to the previous listener is still running, so the
     * objects it captured may be destroyed afterwards.
     */
    void set_listener(Listener listener) {
        std::unique_lock<std::mutex> lock(mutex_);
        listener_ = std::move(listener);
        listeners_idle_.wait(lock, [this]() { return listeners_running_ == 0; });
    }

private:
    const size_t capacity_;
    bool closed_;
    std::deque<T> queue_;
    Listener listener_;
    size_t listeners_running_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable listeners_idle_;
};

} // namespace meshdir
