/**
 * @file FanoutSender.hpp
 * @brief Delivers one compressed frame to every registered client.
 *
 * Each client gets its fragments in index order from its own task. Tasks
 * report success through their future, the caller thread collects every
 * result and only then prunes failed clients from the registry.
 */

#ifndef FANOUT_SENDER_HPP
#define FANOUT_SENDER_HPP

#include "DatagramChannel.hpp"
#include "ClientRegistry.hpp"
#include "FramePacketizer.hpp"
#include <iostream>
#include <vector>
#include <future>
#include <thread>
#include <cstring>

class FanoutSender {
public:
    struct ClientOutcome {
        Endpoint client;
        bool failed;
        size_t fragments_sent;
        size_t fragments_dropped; // local buffer stayed full, fragment skipped
        size_t bytes_sent;
        int error;
    };

    struct SweepReport {
        uint32_t frame_id = 0;
        size_t fragment_count = 0;
        size_t bytes_sent = 0;
        std::vector<ClientOutcome> outcomes;
        std::vector<Endpoint> removed;

        /**
         * @brief True when clients were registered and every one of them failed.
         */
        bool no_viable_clients() const {
            return !outcomes.empty() && removed.size() == outcomes.size();
        }
    };

private:
    DatagramChannel& channel_;
    FramePacketizer packetizer_;
    bool parallel_;
    bool verbose_;

    // Bounded retry on a full send buffer (EAGAIN on the non-blocking socket).
    static const int SEND_RETRY_LIMIT = 1000;

public:
    explicit FanoutSender(DatagramChannel& channel, bool parallel = true, bool verbose = false)
    : channel_(channel), parallel_(parallel), verbose_(verbose) {}

    /**
     * @brief Sends one frame to every client of 'registry', then removes the
     * clients whose delivery failed.
     *
     * @throws FrameTooLarge before anything is sent if the frame cannot be
     * addressed with 8-bit fragment indices.
     */
    SweepReport deliver(const std::vector<uint8_t>& frame, uint32_t frame_id, ClientRegistry& registry) {
        SweepReport report;
        report.frame_id = frame_id;
        report.fragment_count = packetizer_.prepare_frame(frame.data(), frame.size(), frame_id);

        const std::vector<Endpoint> clients = registry.snapshot();
        if (clients.empty()) return report;

        if (parallel_ && clients.size() > 1) {
            std::vector<std::future<ClientOutcome>> pending;
            pending.reserve(clients.size());
            for (const auto& client : clients) {
                pending.push_back(std::async(std::launch::async,
                                             &FanoutSender::deliver_to, this, client));
            }
            for (auto& f : pending) {
                report.outcomes.push_back(f.get());
            }
        } else {
            for (const auto& client : clients) {
                report.outcomes.push_back(deliver_to(client));
            }
        }

        for (const auto& outcome : report.outcomes) {
            if (outcome.failed) {
                report.removed.push_back(outcome.client);
            }
            report.bytes_sent += outcome.bytes_sent;
        }

        registry.remove_all(report.removed);
        for (const auto& c : report.removed) {
            std::cerr << "[Fanout] Dropping client " << c.to_string() << std::endl;
        }
        return report;
    }

private:
    ClientOutcome deliver_to(const Endpoint& client) const {
        ClientOutcome outcome = {client, false, 0, 0, 0, 0};
        const FramePacketizer::Packet* packets = packetizer_.get_packets();
        const size_t count = packetizer_.get_count();

        for (size_t i = 0; i < count; ++i) {
            IoResult res = channel_.send_to(client, packets[i].iov, 2);

            int attempts = 0;
            while (res.status == IoResult::WOULD_BLOCK && ++attempts < SEND_RETRY_LIMIT) {
                std::this_thread::yield();
                res = channel_.send_to(client, packets[i].iov, 2);
            }

            if (res.status == IoResult::WOULD_BLOCK) {
                outcome.fragments_dropped++;
                continue;
            }
            if (!res.is_ok()) {
                std::cerr << "[Fanout] Error sending fragment " << i << " to " << client.to_string()
                          << ": " << std::strerror(res.error) << std::endl;
                outcome.failed = true;
                outcome.error = res.error;
                break;
            }

            outcome.fragments_sent++;
            outcome.bytes_sent += res.bytes;
            if (verbose_) {
                std::cout << "[Fanout] Fragment " << i << " : size " << res.bytes
                          << " -> " << client.to_string() << std::endl;
            }
        }
        return outcome;
    }
};

#endif // FANOUT_SENDER_HPP
