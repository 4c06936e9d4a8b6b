/**
 * @file FramePacketizer.hpp
 * @brief Zero-Copy fragmentation engine for the ScreenStream UDP protocol.
 *
 * This class transforms a compressed frame into a sequence of datagrams
 * without copying the payload data (Zero-Copy using scatter/gather I/O).
 * Every frame ends with a fragment shorter than SCS_UDP_MAX_PAYLOAD, which
 * is empty when the frame size is an exact multiple of the payload size.
 */

#ifndef FRAME_PACKETIZER_HPP
#define FRAME_PACKETIZER_HPP

#include "scs_udp_protocol.h"
#include <vector>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <sys/uio.h>

/**
 * @brief Thrown when a frame needs more than SCS_UDP_MAX_FRAGMENTS fragments.
 * The chunk size is too small for the compressed frame size.
 */
class FrameTooLarge : public std::length_error {
public:
    explicit FrameTooLarge(size_t size)
    : std::length_error("FramePacketizer: frame of " + std::to_string(size) +
                        " bytes needs more than " + std::to_string(SCS_UDP_MAX_FRAGMENTS) +
                        " fragments") {}
};

class FramePacketizer {
public:
    // Represents a ready-to-send packet
    struct Packet {
        ScsUdpHeader header;   // Local storage for the wire header
        struct iovec iov[2];   // Vector for sendmsg (0: Header, 1: Payload)
    };

private:
    // Pool of pre-allocated packets to avoid dynamic allocation in the hot loop
    std::vector<Packet> packet_pool_;

    // Number of valid packets for the current frame
    size_t current_count_ = 0;

public:
    FramePacketizer() {
        packet_pool_.resize(SCS_UDP_MAX_FRAGMENTS);
    }

    // The iovecs point into the pool itself.
    FramePacketizer(const FramePacketizer&) = delete;
    FramePacketizer& operator=(const FramePacketizer&) = delete;

    /**
     * @brief Number of fragments a frame of 'size' bytes is split into.
     */
    static size_t fragment_count(size_t size) {
        return size / SCS_UDP_MAX_PAYLOAD + 1;
    }

    /**
     * @brief Prepares a frame for transmission by fragmenting it.
     *
     * @param data Pointer to the compressed frame. Must outlive the packets.
     * @param size Total size of the data in bytes.
     * @param frame_id The identifier stamped on every fragment.
     * @return The number of fragments generated.
     * @throws FrameTooLarge past SCS_UDP_MAX_FRAGMENTS fragments.
     */
    size_t prepare_frame(const void* data, size_t size, uint32_t frame_id) {
        if (size > SCS_UDP_MAX_FRAME_SIZE) {
            throw FrameTooLarge(size);
        }

        const size_t total_frags = fragment_count(size);
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        size_t remaining = size;
        size_t offset = 0;

        // We iterate through the pool and configure pointers. No data copy happens here.
        for (size_t i = 0; i < total_frags; ++i) {
            Packet& p = packet_pool_[i];

            uint8_t* raw = reinterpret_cast<uint8_t*>(&p.header);
            raw[0] = static_cast<uint8_t>(i);
            scs_store_le32(raw + 1, frame_id);

            size_t chunk_size = std::min(remaining, static_cast<size_t>(SCS_UDP_MAX_PAYLOAD));

            p.iov[0].iov_base = &p.header;
            p.iov[0].iov_len = sizeof(ScsUdpHeader);

            p.iov[1].iov_base = const_cast<uint8_t*>(bytes + offset);
            p.iov[1].iov_len = chunk_size;

            offset += chunk_size;
            remaining -= chunk_size;
        }

        current_count_ = total_frags;
        return current_count_;
    }

    const Packet* get_packets() const {
        return packet_pool_.data();
    }

    size_t get_count() const {
        return current_count_;
    }
};

#endif // FRAME_PACKETIZER_HPP
