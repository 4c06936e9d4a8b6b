/**
 * @file FrameCache.hpp
 * @brief Reassembly of fragmented UDP frames for ScreenStream.
 *
 * Holds at most max_frames in-flight frames in creation order. A frame is
 * complete once its highest fragment is shorter than SCS_UDP_MAX_PAYLOAD
 * (the sender always ends a frame with a short, possibly empty, fragment).
 */

#ifndef FRAME_CACHE_HPP
#define FRAME_CACHE_HPP

#include "ScsPacket.hpp"
#include <vector>
#include <deque>
#include <algorithm>

class FrameCache {
public:
    enum class Status {
        NO_FRAME,        // nothing complete yet, retry later
        NON_SEQUENTIAL,  // oldest complete frame has a gap, fragments returned
        READY            // data holds the reassembled frame
    };

    struct Result {
        Status status;
        uint32_t frame_id;
        std::vector<uint8_t> data;
        std::vector<ScsPacket> fragments;
    };

private:
    struct PendingFrame {
        uint32_t frame_id;
        std::vector<ScsPacket> packets; // sorted by index, no duplicates
    };

    std::deque<PendingFrame> frames_; // front is the oldest
    const size_t max_frames_;

public:
    explicit FrameCache(size_t max_frames = SCS_MAX_FRAMES)
    : max_frames_(max_frames == 0 ? 1 : max_frames) {}

    /**
     * @brief Stores a fragment. Never fails: duplicates are dropped, unknown
     * frames are created, evicting the oldest frame when the cache is full.
     */
    void add_packet(ScsPacket packet) {
        PendingFrame* frame = find_frame(packet.frame_id);

        if (frame == nullptr) {
            if (frames_.size() >= max_frames_) {
                frames_.pop_front();
            }
            PendingFrame new_frame;
            new_frame.frame_id = packet.frame_id;
            frames_.push_back(std::move(new_frame));
            frame = &frames_.back();
        }

        std::vector<ScsPacket>& packets = frame->packets;
        auto pos = std::lower_bound(packets.begin(), packets.end(), packet);
        if (pos != packets.end() && *pos == packet) return;

        packets.insert(pos, std::move(packet));
    }

    /**
     * @brief Extracts the oldest complete frame.
     *
     * A complete frame with missing fragments is reported as NON_SEQUENTIAL
     * and left in place, it goes away through eviction.
     */
    Result get_frame() {
        Result res = {Status::NO_FRAME, 0, {}, {}};

        auto it = frames_.begin();
        for (; it != frames_.end(); ++it) {
            if (is_complete(*it)) break;
        }
        if (it == frames_.end()) return res;

        res.frame_id = it->frame_id;
        const std::vector<ScsPacket>& packets = it->packets;

        if (!is_sequential(packets)) {
            res.status = Status::NON_SEQUENTIAL;
            res.fragments = packets;
            return res;
        }

        size_t total_size = 0;
        for (const auto& p : packets) total_size += p.payload.size();

        res.data.reserve(total_size);
        for (const auto& p : packets) {
            res.data.insert(res.data.end(), p.payload.begin(), p.payload.end());
        }

        res.status = Status::READY;
        frames_.erase(it);
        return res;
    }

    size_t size() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }
    size_t capacity() const { return max_frames_; }

    bool contains(uint32_t frame_id) const {
        return find_frame(frame_id) != nullptr;
    }

    /**
     * @brief Frame ids from oldest to newest.
     */
    std::vector<uint32_t> frame_ids() const {
        std::vector<uint32_t> ids;
        for (const auto& f : frames_) ids.push_back(f.frame_id);
        return ids;
    }

    /**
     * @brief Fragments held for one frame, empty if the frame is unknown.
     */
    std::vector<ScsPacket> fragments(uint32_t frame_id) const {
        const PendingFrame* frame = find_frame(frame_id);
        if (frame == nullptr) return {};
        return frame->packets;
    }

private:
    PendingFrame* find_frame(uint32_t frame_id) {
        for (auto& f : frames_) {
            if (f.frame_id == frame_id) return &f;
        }
        return nullptr;
    }

    const PendingFrame* find_frame(uint32_t frame_id) const {
        for (const auto& f : frames_) {
            if (f.frame_id == frame_id) return &f;
        }
        return nullptr;
    }

    static bool is_complete(const PendingFrame& frame) {
        return !frame.packets.empty() && frame.packets.back().is_terminator();
    }

    static bool is_sequential(const std::vector<ScsPacket>& packets) {
        for (size_t i = 0; i < packets.size(); ++i) {
            if (packets[i].index != i) return false;
        }
        return true;
    }
};

#endif // FRAME_CACHE_HPP
