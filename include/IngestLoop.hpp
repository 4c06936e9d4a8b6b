/**
 * @file IngestLoop.hpp
 * @brief Client receive loop feeding the shared reassembly cache.
 *
 * The loop only holds the cache lock inside add_packet(), never across a
 * receive. The channel is expected to have a receive timeout so that the
 * 'running' flag is checked regularly.
 */

#ifndef INGEST_LOOP_HPP
#define INGEST_LOOP_HPP

#include "DatagramChannel.hpp"
#include "SharedFrameCache.hpp"
#include <iostream>
#include <atomic>
#include <vector>
#include <cstdlib>
#include <cstring>

class IngestLoop {
public:
    enum class Exit {
        STOPPED,           // 'running' was cleared
        SERVER_CLOSED,     // zero-length read
        CONNECTION_RESET,  // peer reset / refused
        IO_ERROR           // anything else
    };

    // Process exit statuses, see exit_status().
    static const int EXIT_SERVER_CLOSED = 0;
    static const int EXIT_CONNECTION_RESET = 0;
    static const int EXIT_IO_ERROR = 1;

private:
    // Larger than any UDP/IPv4 datagram.
    static const size_t RX_BUFFER_SIZE = 65536;

    DatagramChannel& channel_;
    SharedFrameCachePtr cache_;
    bool verbose_;
    std::vector<uint8_t> rx_buffer_;
    int last_error_ = 0;

    std::atomic<size_t> fragments_{0};
    std::atomic<size_t> bytes_{0};
    std::atomic<size_t> discarded_{0};

public:
    IngestLoop(DatagramChannel& channel, SharedFrameCachePtr cache, bool verbose = false)
    : channel_(channel), cache_(cache), verbose_(verbose), rx_buffer_(RX_BUFFER_SIZE) {}

    static int exit_status(Exit exit) {
        switch (exit) {
            case Exit::SERVER_CLOSED:    return EXIT_SERVER_CLOSED;
            case Exit::CONNECTION_RESET: return EXIT_CONNECTION_RESET;
            case Exit::IO_ERROR:         return EXIT_IO_ERROR;
            default:                     return EXIT_SUCCESS;
        }
    }

    /**
     * @brief Receives until 'running' is cleared or the stream is gone.
     */
    Exit run(const std::atomic<bool>& running) {
        Exit exit = Exit::STOPPED;
        while (running) {
            if (!step(exit)) return exit;
        }
        return Exit::STOPPED;
    }

    /**
     * @brief Handles one receive.
     * @return false when the loop must end, 'exit' then tells why.
     */
    bool step(Exit& exit) {
        IoResult res = channel_.receive(rx_buffer_.data(), rx_buffer_.size(), nullptr);

        switch (res.status) {
            case IoResult::WOULD_BLOCK:
                return true;
            case IoResult::RESET:
                last_error_ = res.error;
                exit = Exit::CONNECTION_RESET;
                return false;
            case IoResult::FAILED:
                last_error_ = res.error;
                exit = Exit::IO_ERROR;
                return false;
            default:
                break;
        }

        const size_t len = res.bytes;
        if (len == 0) {
            exit = Exit::SERVER_CLOSED;
            return false;
        }

        // Control bytes and junk cannot be fragments.
        if (len < SCS_UDP_META_SIZE) {
            discarded_++;
            if (verbose_) std::cerr << "[Ingest] Invalid packet received (" << len << " bytes)" << std::endl;
            return true;
        }
        // Senders never exceed the chunk size, a larger datagram means both ends
        // disagree on it. Dropped whole, never split into chunk-sized fragments.
        if (len > SCS_UDP_CHUNK_SIZE) {
            discarded_++;
            std::cerr << "[Ingest] Oversized datagram (" << len << " bytes), chunk size mismatch?" << std::endl;
            return true;
        }

        ScsPacket packet = ScsPacket::decode(rx_buffer_.data(), len);
        if (verbose_) {
            std::cout << "[Ingest] Fragment frame: " << packet.frame_id
                      << " index: " << static_cast<int>(packet.index) << std::endl;
        }
        cache_->add_packet(std::move(packet));

        fragments_++;
        bytes_ += len;
        return true;
    }

    void report(Exit exit) const {
        switch (exit) {
            case Exit::SERVER_CLOSED:
                std::cout << "[Ingest] Server closed the connection" << std::endl;
                break;
            case Exit::CONNECTION_RESET:
                std::cout << "[Ingest] Connection reset by server" << std::endl;
                break;
            case Exit::IO_ERROR:
                std::cerr << "[Ingest] Error receiving data: " << std::strerror(last_error_) << std::endl;
                break;
            default:
                break;
        }
    }

    size_t fragments_received() const { return fragments_; }
    size_t bytes_received() const { return bytes_; }
    size_t datagrams_discarded() const { return discarded_; }
    int last_error() const { return last_error_; }
};

#endif // INGEST_LOOP_HPP
