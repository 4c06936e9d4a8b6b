/**
 * @file SharedFrameCache.hpp
 * @brief Thread-safe handle on a FrameCache shared by the ingest and render loops.
 *
 * Every call holds the lock for exactly one cache operation. Nothing here
 * blocks on the network, so the ingest thread never keeps the lock across a
 * receive.
 */

#ifndef SHARED_FRAME_CACHE_HPP
#define SHARED_FRAME_CACHE_HPP

#include "FrameCache.hpp"
#include <memory>
#include <mutex>

class SharedFrameCache {
private:
    FrameCache cache_;
    mutable std::mutex mutex_;

public:
    explicit SharedFrameCache(size_t max_frames = SCS_MAX_FRAMES)
    : cache_(max_frames) {}

    SharedFrameCache(const SharedFrameCache&) = delete;
    SharedFrameCache& operator=(const SharedFrameCache&) = delete;

    void add_packet(ScsPacket packet) {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.add_packet(std::move(packet));
    }

    FrameCache::Result get_frame() {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.get_frame();
    }

    /**
     * @brief Same as get_frame() but gives up immediately if the ingest
     * thread holds the lock.
     * @return false if the lock was busy, 'out' is then untouched.
     */
    bool try_get_frame(FrameCache::Result& out) {
        std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
        if (!lock.owns_lock()) return false;
        out = cache_.get_frame();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    std::vector<uint32_t> frame_ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.frame_ids();
    }
};

typedef std::shared_ptr<SharedFrameCache> SharedFrameCachePtr;

#endif // SHARED_FRAME_CACHE_HPP
