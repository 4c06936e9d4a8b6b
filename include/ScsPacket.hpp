/**
 * @file ScsPacket.hpp
 * @brief One datagram-sized fragment of a compressed frame, and its codec.
 */

#ifndef SCS_PACKET_HPP
#define SCS_PACKET_HPP

#include "scs_udp_protocol.h"
#include <vector>
#include <string>
#include <stdexcept>
#include <algorithm>
#include <utility>

/**
 * @brief Thrown when a buffer is too short to hold a fragment header.
 */
class MalformedPacket : public std::runtime_error {
public:
    explicit MalformedPacket(size_t size)
    : std::runtime_error("ScsPacket: " + std::to_string(size) +
                         " bytes is shorter than the fragment header") {}
};

struct ScsPacket {
    uint8_t index = 0;
    uint32_t frame_id = 0;
    std::vector<uint8_t> payload;

    ScsPacket() = default;

    ScsPacket(uint8_t idx, uint32_t id, std::vector<uint8_t> data)
    : index(idx), frame_id(id), payload(std::move(data)) {}

    ScsPacket(uint8_t idx, uint32_t id, const uint8_t* data, size_t size)
    : index(idx), frame_id(id), payload(data, data + size) {}

    /**
     * @brief Serializes to the wire layout: index, frame_id (LE), payload.
     */
    std::vector<uint8_t> encode() const {
        std::vector<uint8_t> bytes(SCS_UDP_META_SIZE + payload.size());
        bytes[0] = index;
        scs_store_le32(&bytes[1], frame_id);
        std::copy(payload.begin(), payload.end(), bytes.begin() + SCS_UDP_META_SIZE);
        return bytes;
    }

    /**
     * @brief Parses one fragment.
     *
     * @throws MalformedPacket if fewer than SCS_UDP_META_SIZE bytes are given.
     * The receive loop filters such datagrams out before calling this.
     */
    static ScsPacket decode(const uint8_t* data, size_t size) {
        if (size < SCS_UDP_META_SIZE) {
            throw MalformedPacket(size);
        }
        return ScsPacket(data[0], scs_load_le32(data + 1),
                         data + SCS_UDP_META_SIZE, size - SCS_UDP_META_SIZE);
    }

    static ScsPacket decode(const std::vector<uint8_t>& bytes) {
        return decode(bytes.data(), bytes.size());
    }

    bool is_terminator() const {
        return payload.size() < SCS_UDP_MAX_PAYLOAD;
    }
};

// Equality is addressing only: a resend with the same frame id and index is a
// duplicate regardless of its payload.
inline bool operator==(const ScsPacket& a, const ScsPacket& b) {
    return a.frame_id == b.frame_id && a.index == b.index;
}

inline bool operator!=(const ScsPacket& a, const ScsPacket& b) {
    return !(a == b);
}

// Packets only order within one frame.
inline bool operator<(const ScsPacket& a, const ScsPacket& b) {
    if (a.frame_id != b.frame_id) {
        throw std::logic_error("ScsPacket: ordering packets of different frames");
    }
    return a.index < b.index;
}

#endif // SCS_PACKET_HPP
