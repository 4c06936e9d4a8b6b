/**
 * @file UdpSocket.hpp
 * @brief RAII wrapper for POSIX UDP sockets with high-performance tuning.
 */

#ifndef UDP_SOCKET_HPP
#define UDP_SOCKET_HPP

#include "DatagramChannel.hpp"
#include <string>
#include <stdexcept>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <sys/time.h>

class UdpSocket : public DatagramChannel {
private:
    int sockfd_ = -1;
    Endpoint peer_;
    bool is_bound_ = false;
    bool is_connected_ = false;

    static std::runtime_error socket_error(const std::string& what) {
        return std::runtime_error("UdpSocket: " + what + " (" + std::strerror(errno) + ")");
    }

public:
    UdpSocket() {
        sockfd_ = socket(AF_INET, SOCK_DGRAM, 0);
        if (sockfd_ < 0) {
            throw socket_error("Failed to create socket");
        }

        // Frames arrive as bursts of up to 256 near-64KB datagrams.
        // If the kernel limit is lower, it will be capped silently.
        // Note: You might need to run `sysctl -w net.core.rmem_max=33554432` on Linux.
        int buf_size = 32 * 1024 * 1024;
        setsockopt(sockfd_, SOL_SOCKET, SO_RCVBUF, &buf_size, sizeof(buf_size));
        setsockopt(sockfd_, SOL_SOCKET, SO_SNDBUF, &buf_size, sizeof(buf_size));
    }

    ~UdpSocket() {
        if (sockfd_ >= 0) {
            close(sockfd_);
        }
    }

    // Disable copy to avoid double-close
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    /**
     * @brief Server Mode: Bind to a specific local port (0 = ephemeral).
     */
    void bind_port(uint16_t port) {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY); // Listen on all interfaces
        addr.sin_port = htons(port);

        // Allow restarting the server immediately after a crash
        int opt = 1;
        setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        if (bind(sockfd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
            throw socket_error("Failed to bind port " + std::to_string(port));
        }
        is_bound_ = true;
    }

    /**
     * @brief Client Mode: fix the remote peer. Only datagrams from it are
     * received afterwards, and ICMP errors surface as ECONNREFUSED.
     */
    void connect_to(const Endpoint& peer) {
        const struct sockaddr_in& addr = peer.sockaddr();
        if (connect(sockfd_, (const struct sockaddr*)&addr, sizeof(addr)) < 0) {
            throw socket_error("Failed to connect to " + peer.to_string());
        }
        peer_ = peer;
        is_connected_ = true;
    }

    void set_nonblocking(bool enabled) {
        int flags = fcntl(sockfd_, F_GETFL, 0);
        if (flags < 0) {
            throw socket_error("fcntl(F_GETFL) failed");
        }
        flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
        if (fcntl(sockfd_, F_SETFL, flags) < 0) {
            throw socket_error("fcntl(F_SETFL) failed");
        }
    }

    /**
     * @brief Set a reception timeout (to unblock recv loop cleanly).
     */
    void set_recv_timeout(int timeout_ms) {
        struct timeval tv;
        tv.tv_sec = timeout_ms / 1000;
        tv.tv_usec = (timeout_ms % 1000) * 1000;
        setsockopt(sockfd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    }

    /**
     * @brief Actual kernel receive buffer size, in bytes.
     */
    int kernel_rcvbuf() const {
        int actual_rcv_buf = 0;
        socklen_t optlen = sizeof(actual_rcv_buf);
        if (getsockopt(sockfd_, SOL_SOCKET, SO_RCVBUF, &actual_rcv_buf, &optlen) != 0) {
            return -1;
        }
        return actual_rcv_buf;
    }

    /**
     * @brief Locally bound address (useful after binding port 0).
     */
    Endpoint local_endpoint() const {
        struct sockaddr_in addr;
        socklen_t len = sizeof(addr);
        std::memset(&addr, 0, sizeof(addr));
        if (getsockname(sockfd_, (struct sockaddr*)&addr, &len) < 0) {
            throw socket_error("getsockname failed");
        }
        return Endpoint(addr);
    }

    IoResult send_to(const Endpoint& dest, const struct iovec* iov, size_t iovcnt) override {
        struct msghdr msg;
        std::memset(&msg, 0, sizeof(msg));
        msg.msg_name = const_cast<struct sockaddr_in*>(&dest.sockaddr());
        msg.msg_namelen = sizeof(struct sockaddr_in);
        // Kernel reads only.
        msg.msg_iov = const_cast<struct iovec*>(iov);
        msg.msg_iovlen = iovcnt;

        ssize_t sent = sendmsg(sockfd_, &msg, MSG_NOSIGNAL);
        if (sent < 0) return IoResult::from_errno(errno);
        return IoResult::ok(static_cast<size_t>(sent));
    }

    IoResult send(const void* data, size_t size) override {
        ssize_t sent = ::send(sockfd_, data, size, MSG_NOSIGNAL);
        if (sent < 0) return IoResult::from_errno(errno);
        return IoResult::ok(static_cast<size_t>(sent));
    }

    IoResult receive(void* buffer, size_t capacity, Endpoint* from) override {
        struct sockaddr_in src;
        socklen_t src_len = sizeof(src);
        std::memset(&src, 0, sizeof(src));

        ssize_t len = recvfrom(sockfd_, buffer, capacity, 0, (struct sockaddr*)&src, &src_len);
        if (len < 0) return IoResult::from_errno(errno);
        if (from != nullptr) *from = Endpoint(src);
        return IoResult::ok(static_cast<size_t>(len));
    }

    int get_fd() const { return sockfd_; }
    bool is_bound() const { return is_bound_; }
    bool is_connected() const { return is_connected_; }
    const Endpoint& peer() const { return peer_; }
};

#endif // UDP_SOCKET_HPP
