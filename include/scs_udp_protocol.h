/**
 * @file scs_udp_protocol.h
 * @brief ScreenStream UDP Transport Protocol Definition.
 *
 * This file defines the binary structure for transmitting compressed screen
 * frames over UDP with fragmentation support, and the one-byte control
 * messages exchanged on the same socket.
 */

#ifndef SCS_UDP_PROTOCOL_H
#define SCS_UDP_PROTOCOL_H

#include <cstdint>
#include <cstddef>

// --------------------------------------------------------------------------
// PROTOCOL CONFIGURATION
// --------------------------------------------------------------------------

/**
 * @brief Maximum size of one outgoing datagram (in bytes).
 *
 * Kept below the 65507 bytes UDP/IPv4 limit. This is a deployment parameter,
 * both ends must agree on it because a fragment shorter than the maximum
 * payload marks the end of a frame.
 */
static const uint32_t SCS_UDP_CHUNK_SIZE = 4096 * 15;

/**
 * @brief Size of the fragment header: 1 byte index + 4 bytes frame id.
 */
static const uint32_t SCS_UDP_META_SIZE = 5;

/**
 * @brief Maximum payload carried by one fragment.
 */
static const uint32_t SCS_UDP_MAX_PAYLOAD = SCS_UDP_CHUNK_SIZE - SCS_UDP_META_SIZE;

/**
 * @brief Maximum number of fragments per frame.
 *
 * Limited by the 'index' field (uint8_t).
 */
static const uint32_t SCS_UDP_MAX_FRAGMENTS = 256;

/**
 * @brief Maximum supported frame size.
 *
 * The last fragment is always shorter than SCS_UDP_MAX_PAYLOAD (possibly
 * empty), so 256 fragments carry at most 256 * MAX_PAYLOAD - 1 bytes.
 */
static const uint64_t SCS_UDP_MAX_FRAME_SIZE =
    static_cast<uint64_t>(SCS_UDP_MAX_FRAGMENTS) * SCS_UDP_MAX_PAYLOAD - 1;

/**
 * @brief Number of frames held by the receiver reassembly cache.
 */
static const size_t SCS_MAX_FRAMES = 3;

// --------------------------------------------------------------------------
// CONTROL MESSAGES (1 BYTE DATAGRAMS)
// --------------------------------------------------------------------------

// A control datagram is shorter than SCS_UDP_META_SIZE, which is what tells
// it apart from a fragment.
static const uint8_t SCS_CTRL_PING           = 1;
static const uint8_t SCS_CTRL_NEW_CONNECTION = 2;
static const uint8_t SCS_CTRL_DISCONNECTION  = 3;
static const uint8_t SCS_CTRL_REQUEST_FRAME  = 4;
static const uint8_t SCS_CTRL_GENERAL_OK     = 5;

// --------------------------------------------------------------------------
// BINARY HEADER STRUCTURE (5 BYTES)
// --------------------------------------------------------------------------

// Force 1-byte packing to prevent the compiler from adding padding.
// The structure must remain exactly 5 bytes (40 bits).
#pragma pack(push, 1)

struct ScsUdpHeader {
    /**
     * @brief Fragment Index (8 bits).
     * Position of this fragment within its frame, fragment 0 is first.
     * Range: [0 ... 255]
     */
    uint8_t index;

    /**
     * @brief Frame Identifier (32 bits).
     * Set once per outgoing frame. Only compared for equality by the
     * receiver, never ordered.
     *
     * @note Convention: Little Endian on the wire.
     */
    uint32_t frame_id;
};

#pragma pack(pop) // Restore default packing

// --------------------------------------------------------------------------
// STATIC VALIDATION
// --------------------------------------------------------------------------

static_assert(sizeof(ScsUdpHeader) == SCS_UDP_META_SIZE,
    "SCS UDP Protocol Error: Header size mismatch! Must be exactly 5 bytes.");

static_assert(SCS_UDP_CHUNK_SIZE <= 65507,
    "SCS UDP Protocol Error: Chunk size exceeds the UDP/IPv4 payload limit.");

// --------------------------------------------------------------------------
// BYTE ORDER HELPERS
// --------------------------------------------------------------------------

inline void scs_store_le32(uint8_t* dst, uint32_t value) {
    dst[0] = static_cast<uint8_t>(value);
    dst[1] = static_cast<uint8_t>(value >> 8);
    dst[2] = static_cast<uint8_t>(value >> 16);
    dst[3] = static_cast<uint8_t>(value >> 24);
}

inline uint32_t scs_load_le32(const uint8_t* src) {
    return static_cast<uint32_t>(src[0])
        | (static_cast<uint32_t>(src[1]) << 8)
        | (static_cast<uint32_t>(src[2]) << 16)
        | (static_cast<uint32_t>(src[3]) << 24);
}

#endif // SCS_UDP_PROTOCOL_H
