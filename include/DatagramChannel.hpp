/**
 * @file DatagramChannel.hpp
 * @brief Abstract datagram I/O used by the fan-out and ingest loops.
 *
 * UdpSocket is the production implementation. Tests substitute scripted or
 * failing channels.
 */

#ifndef DATAGRAM_CHANNEL_HPP
#define DATAGRAM_CHANNEL_HPP

#include "Endpoint.hpp"
#include <cstddef>
#include <cerrno>
#include <sys/uio.h>

struct IoResult {
    enum Status {
        OK,           // 'bytes' were transferred (0 is a valid datagram size)
        WOULD_BLOCK,  // nothing available yet / timeout / buffer full
        RESET,        // peer reset or refused the connection
        FAILED        // anything else, see 'error'
    };

    Status status;
    size_t bytes;
    int error;

    static IoResult ok(size_t n) { IoResult r = {OK, n, 0}; return r; }

    /**
     * @brief Classifies an errno value from a socket call.
     */
    static IoResult from_errno(int err) {
        IoResult r = {FAILED, 0, err};
        if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) r.status = WOULD_BLOCK;
        else if (err == ECONNRESET || err == ECONNREFUSED) r.status = RESET;
        return r;
    }

    bool is_ok() const { return status == OK; }
};

class DatagramChannel {
public:
    DatagramChannel() {}
    virtual ~DatagramChannel() {}

    /**
     * @brief Sends one datagram gathered from 'iov' to 'dest'.
     * Must be callable from several threads at once.
     */
    virtual IoResult send_to(const Endpoint& dest, const struct iovec* iov, size_t iovcnt) = 0;

    /**
     * @brief Sends one datagram to the connected peer.
     */
    virtual IoResult send(const void* data, size_t size) = 0;

    /**
     * @brief Receives one datagram. 'from' may be null.
     */
    virtual IoResult receive(void* buffer, size_t capacity, Endpoint* from) = 0;
};

#endif // DATAGRAM_CHANNEL_HPP
