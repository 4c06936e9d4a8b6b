/**
 * @file FrameIdClock.hpp
 * @brief Generates frame ids from the milliseconds elapsed since start.
 *
 * Ids wrap after 2^32 ms (about 49 days). Receivers compare them for
 * equality only.
 */

#ifndef FRAME_ID_CLOCK_HPP
#define FRAME_ID_CLOCK_HPP

#include <cstdint>
#include <chrono>

class FrameIdClock {
private:
    std::chrono::steady_clock::time_point epoch_;
    uint32_t last_id_ = 0;
    bool has_last_ = false;

public:
    FrameIdClock() : epoch_(std::chrono::steady_clock::now()) {}

    /**
     * @brief Next id. Two frames produced within the same millisecond would
     * merge on the receiver, so an id never repeats the previous one.
     */
    uint32_t next() {
        return next_at(std::chrono::steady_clock::now());
    }

    uint32_t next_at(std::chrono::steady_clock::time_point now) {
        uint64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - epoch_).count();
        uint32_t id = static_cast<uint32_t>(ms);
        if (has_last_ && static_cast<int32_t>(id - last_id_) <= 0) id = last_id_ + 1;
        last_id_ = id;
        has_last_ = true;
        return id;
    }

    std::chrono::steady_clock::time_point epoch() const { return epoch_; }
};

#endif // FRAME_ID_CLOCK_HPP
