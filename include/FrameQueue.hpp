/**
 * @file FrameQueue.hpp
 * @brief Bounded handoff of compressed frames from capture/encode to delivery.
 */

#ifndef FRAME_QUEUE_HPP
#define FRAME_QUEUE_HPP

#include <cstdint>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>

struct EncodedFrame {
    uint32_t frame_id = 0;
    std::vector<uint8_t> data;
};

class FrameQueue {
private:
    std::deque<EncodedFrame> frames_;
    const size_t capacity_;
    bool stopped_ = false;
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;

public:
    explicit FrameQueue(size_t capacity = 1)
    : capacity_(capacity == 0 ? 1 : capacity) {}

    /**
     * @brief Waits for a free slot, so capture never runs ahead of delivery.
     * @return false if the queue was stopped.
     */
    bool push(EncodedFrame frame) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return frames_.size() < capacity_ || stopped_; });
        if (stopped_) return false;
        frames_.push_back(std::move(frame));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /**
     * @return false if the queue is full or stopped.
     */
    bool try_push(EncodedFrame frame) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_ || frames_.size() >= capacity_) return false;
            frames_.push_back(std::move(frame));
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Takes the oldest frame, waiting up to timeout_ms (0 = no wait).
     * @return false on timeout or once stopped and drained.
     */
    bool pop(EncodedFrame& out, int timeout_ms = 0) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready_pred = [this] { return !frames_.empty() || stopped_; };

        if (timeout_ms > 0) {
            not_empty_.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready_pred);
        }
        if (frames_.empty()) return false;

        out = std::move(frames_.front());
        frames_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return true;
    }

    /**
     * @brief Wakes up every waiter, further pushes are refused.
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    /**
     * @brief Drops every queued frame.
     * @return number of frames dropped.
     */
    size_t clear() {
        size_t dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped = frames_.size();
            frames_.clear();
        }
        not_full_.notify_all();
        return dropped;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_.size();
    }

    bool empty() {
        std::lock_guard<std::mutex> lock(mutex_);
        return frames_.empty();
    }

    size_t capacity() const { return capacity_; }
};

#endif // FRAME_QUEUE_HPP
