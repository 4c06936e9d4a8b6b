/**
 * @file ClientRegistry.hpp
 * @brief Set of peers currently subscribed to the stream.
 *
 * Owned by the server loop thread. Delivery tasks never touch it, they report
 * failures back and the loop applies removals once the sweep is over.
 */

#ifndef CLIENT_REGISTRY_HPP
#define CLIENT_REGISTRY_HPP

#include "Endpoint.hpp"
#include <set>
#include <vector>

class ClientRegistry {
private:
    std::set<Endpoint> clients_;

public:
    /**
     * @return true if the client was not registered yet.
     */
    bool add(const Endpoint& client) {
        return clients_.insert(client).second;
    }

    /**
     * @return true if the client was registered.
     */
    bool remove(const Endpoint& client) {
        return clients_.erase(client) > 0;
    }

    /**
     * @brief Batched removal after a delivery sweep.
     * @return number of clients actually removed.
     */
    size_t remove_all(const std::vector<Endpoint>& clients) {
        size_t removed = 0;
        for (const auto& c : clients) {
            if (remove(c)) removed++;
        }
        return removed;
    }

    bool contains(const Endpoint& client) const {
        return clients_.count(client) > 0;
    }

    std::vector<Endpoint> snapshot() const {
        return std::vector<Endpoint>(clients_.begin(), clients_.end());
    }

    size_t size() const { return clients_.size(); }
    bool empty() const { return clients_.empty(); }
    void clear() { clients_.clear(); }
};

#endif // CLIENT_REGISTRY_HPP
