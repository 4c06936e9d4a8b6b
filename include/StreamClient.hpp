/**
 * @file StreamClient.hpp
 * @brief Client side of a stream: announce, ingest thread, keepalive, drain.
 *
 * The ingest thread and the consumer (render loop) share only the frame
 * cache. The consumer never waits on it, see next_frame().
 */

#ifndef STREAM_CLIENT_HPP
#define STREAM_CLIENT_HPP

#include "ControlMessage.hpp"
#include "IngestLoop.hpp"
#include <thread>
#include <chrono>
#include <functional>
#include <stdexcept>

class StreamClient {
public:
    struct Config {
        int keepalive_ms = 1000;
        size_t max_frames = SCS_MAX_FRAMES;
        bool verbose = false;
    };

    // Called from the ingest thread with the process exit status once the
    // stream is gone. The default terminates the process.
    typedef std::function<void(int)> TerminateHandler;

private:
    DatagramChannel& channel_;
    Config config_;
    SharedFrameCachePtr cache_;
    IngestLoop ingest_;
    TerminateHandler on_terminate_;

    std::thread ingest_thread_;
    std::atomic<bool> running_{false};
    std::chrono::steady_clock::time_point last_keepalive_;

    std::atomic<size_t> frames_ready_{0};
    std::atomic<size_t> frames_non_sequential_{0};
    uint32_t last_gap_frame_id_ = 0;
    bool has_gap_frame_ = false;

public:
    /**
     * @param channel Socket already connected to the server, with a receive
     *                timeout so that abort() is bounded.
     */
    StreamClient(DatagramChannel& channel, const Config& config)
    : channel_(channel),
      config_(config),
      cache_(std::make_shared<SharedFrameCache>(config.max_frames)),
      ingest_(channel, cache_, config.verbose),
      on_terminate_(&StreamClient::terminate_process) {}

    ~StreamClient() {
        abort();
    }

    StreamClient(const StreamClient&) = delete;
    StreamClient& operator=(const StreamClient&) = delete;

    void set_terminate_handler(TerminateHandler handler) {
        on_terminate_ = handler;
    }

    /**
     * @brief Announces this client to the server.
     * @throws std::runtime_error if the announcement cannot be sent.
     */
    void connect() {
        if (!send_control(ControlMessage::Type::NEW_CONNECTION)) {
            throw std::runtime_error("StreamClient: Error sending connection notification to server");
        }
        last_keepalive_ = std::chrono::steady_clock::now();
    }

    /**
     * @brief Starts the ingest thread.
     */
    void start() {
        if (running_) return;
        running_ = true;
        ingest_thread_ = std::thread(&StreamClient::ingest_main, this);
    }

    /**
     * @brief Stops the ingest thread. Returns within one receive timeout plus
     * one add_packet() call.
     */
    void abort() {
        running_ = false;
        if (ingest_thread_.joinable()) {
            ingest_thread_.join();
        }
    }

    /**
     * @brief Clean shutdown: stop ingesting and tell the server.
     */
    void disconnect() {
        abort();
        send_control(ControlMessage::Type::DISCONNECTION);
    }

    /**
     * @brief Sends a Ping once per keepalive interval.
     * @return false if the stream is closed (send failed).
     */
    bool keepalive() {
        auto now = std::chrono::steady_clock::now();
        if (now - last_keepalive_ < std::chrono::milliseconds(config_.keepalive_ms)) return true;
        last_keepalive_ = now;
        return send_control(ControlMessage::Type::PING);
    }

    /**
     * @brief Non-blocking poll of the cache for the render loop.
     * @return true if a complete frame was extracted into 'data'.
     */
    bool next_frame(std::vector<uint8_t>& data) {
        FrameCache::Result res;
        if (!cache_->try_get_frame(res)) return false;

        if (res.status == FrameCache::Status::NON_SEQUENTIAL) {
            // The same gappy frame is reported on every poll until evicted.
            if (has_gap_frame_ && res.frame_id == last_gap_frame_id_) return false;
            has_gap_frame_ = true;
            last_gap_frame_id_ = res.frame_id;
            frames_non_sequential_++;
            if (config_.verbose) {
                std::cout << "[Client] Not sequential frame " << res.frame_id << ":";
                for (const auto& p : res.fragments) std::cout << " " << static_cast<int>(p.index);
                std::cout << std::endl;
            }
            return false;
        }
        if (res.status != FrameCache::Status::READY) return false;

        data = std::move(res.data);
        frames_ready_++;
        return true;
    }

    bool is_running() const { return running_; }
    SharedFrameCachePtr cache() const { return cache_; }
    const IngestLoop& ingest() const { return ingest_; }
    size_t frames_ready() const { return frames_ready_; }
    size_t frames_non_sequential() const { return frames_non_sequential_; }

private:
    void ingest_main() {
        IngestLoop::Exit exit = ingest_.run(running_);
        if (exit == IngestLoop::Exit::STOPPED) return;

        running_ = false;
        ingest_.report(exit);
        on_terminate_(IngestLoop::exit_status(exit));
    }

    static void terminate_process(int status) {
        std::cout.flush();
        std::exit(status);
    }

    bool send_control(ControlMessage::Type type) {
        uint8_t byte = ControlMessage::make(type).to_byte();
        IoResult res = channel_.send(&byte, 1);
        return res.is_ok();
    }
};

#endif // STREAM_CLIENT_HPP
