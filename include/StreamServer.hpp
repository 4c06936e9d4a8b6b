/**
 * @file StreamServer.hpp
 * @brief Server driving loop: control channel, client registry and fan-out.
 *
 * Compressed frames are produced elsewhere (see Sink_Encoder) and handed
 * over through a FrameQueue. The loop thread owns the registry.
 */

#ifndef STREAM_SERVER_HPP
#define STREAM_SERVER_HPP

#include "ControlMessage.hpp"
#include "FanoutSender.hpp"
#include "FrameQueue.hpp"
#include <iostream>
#include <atomic>
#include <chrono>
#include <thread>

class StreamServer {
public:
    struct Config {
        int fps = 30;                 // paces the idle loop and the frame wait
        bool parallel = true;         // one delivery task per client
        bool acknowledge = true;      // answer NewConnection with GeneralOk
        bool verbose = false;
        int duration_s = 0;           // 0 = run until stop()
    };

private:
    // Datagrams processed per control poll, keeps a flood from starving delivery.
    static const int CONTROL_BATCH = 64;

    DatagramChannel& channel_;
    FrameQueue& queue_;
    Config config_;
    ClientRegistry registry_;
    FanoutSender sender_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> client_count_{0};
    std::atomic<size_t> frames_sent_{0};
    std::atomic<size_t> bytes_sent_{0};
    std::atomic<size_t> frames_skipped_{0};

public:
    StreamServer(DatagramChannel& channel, FrameQueue& queue, const Config& config)
    : channel_(channel),
      queue_(queue),
      config_(config),
      sender_(channel, config.parallel, config.verbose) {
        if (config_.fps <= 0) config_.fps = 1;
    }

    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;

    /**
     * @brief Runs until stop() or until the configured duration elapsed.
     */
    void run() {
        static const std::atomic<bool> never(false);
        run(never);
    }

    /**
     * @brief Same, also returning once 'interrupted' is set (signal handlers).
     * Exceptions from the channel or the sender propagate, the caller owns
     * the other threads and must stop them.
     */
    void run(const std::atomic<bool>& interrupted) {
        running_ = true;
        const auto start = std::chrono::steady_clock::now();

        try {
            while (running_ && !interrupted) {
                if (config_.duration_s > 0 &&
                    std::chrono::steady_clock::now() - start >= std::chrono::seconds(config_.duration_s)) {
                    std::cout << "[Server] Duration of " << config_.duration_s << " s reached." << std::endl;
                    break;
                }
                run_once();
            }
        } catch (...) {
            running_ = false;
            throw;
        }
        running_ = false;
    }

    void stop() { running_ = false; }
    bool is_running() const { return running_; }

    /**
     * @brief One iteration: poll control messages, then deliver at most one
     * frame if anybody is listening.
     */
    void run_once() {
        poll_control();

        if (registry_.empty()) {
            std::this_thread::sleep_for(frame_period());
            return;
        }

        EncodedFrame frame;
        if (!queue_.pop(frame, static_cast<int>(frame_period().count()))) return;

        deliver(frame);
    }

    /**
     * @brief Drains pending control datagrams without blocking.
     * @return number of control messages handled.
     */
    int poll_control() {
        uint8_t buffer[SCS_UDP_META_SIZE];
        int handled = 0;

        for (int i = 0; i < CONTROL_BATCH; ++i) {
            Endpoint from;
            IoResult res = channel_.receive(buffer, sizeof(buffer), &from);

            if (res.status == IoResult::WOULD_BLOCK) break;
            if (!res.is_ok()) {
                // ICMP errors from a vanished client land here, never fatal.
                if (config_.verbose) {
                    std::cerr << "[Server] Control channel error: " << std::strerror(res.error) << std::endl;
                }
                continue;
            }
            // Fragments and empty datagrams are not control messages.
            if (res.bytes == 0 || res.bytes >= SCS_UDP_META_SIZE) continue;

            handle_control(ControlMessage::from_byte(buffer[0]), from);
            handled++;
        }
        return handled;
    }

    void handle_control(const ControlMessage& msg, const Endpoint& from) {
        switch (msg.type) {
            case ControlMessage::Type::PING:
                break;

            case ControlMessage::Type::NEW_CONNECTION:
                if (registry_.add(from)) {
                    std::cout << "[Server] Client connected: " << from.to_string() << std::endl;
                }
                if (config_.acknowledge) send_control(ControlMessage::Type::GENERAL_OK, from);
                break;

            case ControlMessage::Type::DISCONNECTION:
                if (registry_.remove(from)) {
                    std::cout << "[Server] Client disconnected: " << from.to_string() << std::endl;
                }
                break;

            case ControlMessage::Type::REQUEST_FRAME:
            case ControlMessage::Type::GENERAL_OK:
                if (config_.verbose) {
                    std::cout << "[Server] " << msg.name() << " from " << from.to_string() << std::endl;
                }
                break;

            default:
                std::cout << "[Server] Received Unknown Message: " << static_cast<int>(msg.raw)
                          << " from " << from.to_string() << std::endl;
                break;
        }
        client_count_ = registry_.size();
    }

    /**
     * @brief Sends one frame to every client and prunes the failed ones.
     */
    FanoutSender::SweepReport deliver(const EncodedFrame& frame) {
        FanoutSender::SweepReport report;
        try {
            report = sender_.deliver(frame.data, frame.frame_id, registry_);
        } catch (const FrameTooLarge& e) {
            std::cerr << "[Server] " << e.what() << ", lower the quality or the resolution." << std::endl;
            frames_skipped_++;
            return report;
        }

        frames_sent_++;
        bytes_sent_ += report.bytes_sent;
        client_count_ = registry_.size();

        if (report.no_viable_clients()) {
            // Whatever was captured for the pruned clients is stale for the next one
            const size_t dropped = queue_.clear();
            std::cout << "[Server] All clients disconnected, waiting for new ones." << std::endl;
            if (dropped > 0 && config_.verbose) {
                std::cout << "[Server] Dropped " << dropped << " queued frame(s)." << std::endl;
            }
        }
        return report;
    }

    const ClientRegistry& registry() const { return registry_; }
    ClientRegistry& registry() { return registry_; }

    // Counters, safe to read from a monitor thread.
    size_t client_count() const { return client_count_; }
    bool has_clients() const { return client_count_ > 0; }
    size_t frames_sent() const { return frames_sent_; }
    size_t bytes_sent() const { return bytes_sent_; }
    size_t frames_skipped() const { return frames_skipped_; }

private:
    std::chrono::milliseconds frame_period() const {
        return std::chrono::milliseconds(1000 / config_.fps);
    }

    void send_control(ControlMessage::Type type, const Endpoint& dest) {
        uint8_t byte = ControlMessage::make(type).to_byte();
        struct iovec iov;
        iov.iov_base = &byte;
        iov.iov_len = 1;
        IoResult res = channel_.send_to(dest, &iov, 1);
        if (!res.is_ok() && config_.verbose) {
            std::cerr << "[Server] Could not acknowledge " << dest.to_string() << std::endl;
        }
    }
};

#endif // STREAM_SERVER_HPP
