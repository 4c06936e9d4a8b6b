/**
 * @file Endpoint.hpp
 * @brief IPv4 address + port value type used for peers and the client registry.
 */

#ifndef ENDPOINT_HPP
#define ENDPOINT_HPP

#include <string>
#include <stdexcept>
#include <cstring>
#include <cstdint>
#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

class Endpoint {
private:
    struct sockaddr_in addr_;

public:
    Endpoint() {
        std::memset(&addr_, 0, sizeof(addr_));
        addr_.sin_family = AF_INET;
    }

    explicit Endpoint(const struct sockaddr_in& addr) : addr_(addr) {}

    Endpoint(uint32_t host_order_ip, uint16_t port) : Endpoint() {
        addr_.sin_addr.s_addr = htonl(host_order_ip);
        addr_.sin_port = htons(port);
    }

    /**
     * @brief Resolves a host name or dotted IPv4 address.
     */
    static Endpoint resolve(const std::string& host, uint16_t port) {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_DGRAM;

        struct addrinfo* info = nullptr;
        int rc = getaddrinfo(host.c_str(), nullptr, &hints, &info);
        if (rc != 0 || info == nullptr) {
            throw std::runtime_error("Endpoint: cannot resolve " + host + " (" + gai_strerror(rc) + ")");
        }

        Endpoint ep(*reinterpret_cast<const struct sockaddr_in*>(info->ai_addr));
        ep.addr_.sin_port = htons(port);
        freeaddrinfo(info);
        return ep;
    }

    /**
     * @brief Parses "host:port".
     */
    static Endpoint parse(const std::string& host_port) {
        size_t colon = host_port.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == host_port.size()) {
            throw std::runtime_error("Endpoint: expected host:port, got '" + host_port + "'");
        }
        unsigned long port = 0;
        try {
            port = std::stoul(host_port.substr(colon + 1));
        } catch (const std::exception&) {
            throw std::runtime_error("Endpoint: invalid port in '" + host_port + "'");
        }
        if (port == 0 || port > 65535) {
            throw std::runtime_error("Endpoint: port out of range in '" + host_port + "'");
        }
        return resolve(host_port.substr(0, colon), static_cast<uint16_t>(port));
    }

    const struct sockaddr_in& sockaddr() const { return addr_; }
    uint32_t ip() const { return ntohl(addr_.sin_addr.s_addr); }
    uint16_t port() const { return ntohs(addr_.sin_port); }

    std::string to_string() const {
        char buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(port());
    }
};

inline bool operator==(const Endpoint& a, const Endpoint& b) {
    return a.ip() == b.ip() && a.port() == b.port();
}

inline bool operator!=(const Endpoint& a, const Endpoint& b) {
    return !(a == b);
}

inline bool operator<(const Endpoint& a, const Endpoint& b) {
    if (a.ip() != b.ip()) return a.ip() < b.ip();
    return a.port() < b.port();
}

#endif // ENDPOINT_HPP
