/**
 * @file scs_loopback.cpp
 * @brief Single-process throughput and loss check: server and client over 127.0.0.1.
 */

#include <iostream>
#include <vector>
#include <numeric>
#include <thread>
#include <chrono>
#include <atomic>
#include <iomanip>
#include <string>

#include "UdpSocket.hpp"
#include "StreamServer.hpp"
#include "StreamClient.hpp"
#include "FrameIdClock.hpp"

// Atomic counters for monitoring
std::atomic<size_t> g_frames_queued{0};
std::atomic<size_t> g_bytes_received{0};
std::atomic<size_t> g_frames_received{0};
std::atomic<bool> g_done{false};

// Helper to calculate throughput
double calculate_mbps(size_t bytes, double seconds) {
    if (seconds <= 0) return 0.0;
    return (static_cast<double>(bytes) * 8.0) / (1000.0 * 1000.0 * seconds);
}

void producer_thread_func(FrameQueue& queue, int num_frames, size_t frame_size) {
    FrameIdClock clock;
    std::vector<uint8_t> pattern(frame_size);
    std::iota(pattern.begin(), pattern.end(), 0);

    for (int i = 0; i < num_frames && !g_done; ++i) {
        EncodedFrame frame;
        frame.frame_id = clock.next();
        frame.data = pattern;
        // Blocks until the previous frame was handed to the sender
        if (!queue.push(std::move(frame))) break;
        g_frames_queued++;
    }
    std::cout << "[TX-Thread] Queued " << g_frames_queued << " frames." << std::endl;
}

void rx_drain(StreamClient& client, int expected_frames, size_t expected_size) {
    // Timeout loop counters
    auto last_frame = std::chrono::steady_clock::now();
    const auto max_idle = std::chrono::seconds(2);

    std::vector<uint8_t> frame;
    while (g_frames_received < static_cast<size_t>(expected_frames) && !g_done) {
        if (client.next_frame(frame)) {
            if (frame.size() != expected_size) {
                std::cerr << "[RX] Error: Frame size mismatch! Expected "
                          << expected_size << ", got " << frame.size() << std::endl;
            }
            g_bytes_received += frame.size();
            g_frames_received++;
            last_frame = std::chrono::steady_clock::now();
        } else {
            if (std::chrono::steady_clock::now() - last_frame > max_idle) {
                std::cout << "[RX] Timed out waiting for data." << std::endl;
                break;
            }
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    }
}

int main(int argc, char* argv[]) {
    int num_frames = 100;
    size_t frame_size = 1024 * 1024; // 1 MB

    try {
        if (argc >= 2) num_frames = std::stoi(argv[1]);
        if (argc >= 3) frame_size = std::stoul(argv[2]);
    } catch (const std::logic_error&) {
        std::cerr << "Usage: " << argv[0] << " [n_frames] [frame_size]" << std::endl;
        return 1;
    }
    if (frame_size > SCS_UDP_MAX_FRAME_SIZE) {
        std::cerr << "Frame size is limited to " << SCS_UDP_MAX_FRAME_SIZE << " bytes." << std::endl;
        return 1;
    }

    std::cout << "=========================================" << std::endl;
    std::cout << " ScreenStream Loopback Test " << std::endl;
    std::cout << " Frames: " << num_frames << std::endl;
    std::cout << " Size:   " << frame_size << " bytes" << std::endl;
    std::cout << "=========================================" << std::endl;

    try {
        UdpSocket server_socket;
        server_socket.bind_port(0);
        server_socket.set_nonblocking(true);
        const Endpoint server_addr(INADDR_LOOPBACK, server_socket.local_endpoint().port());

        StreamServer::Config server_config;
        server_config.fps = 200;
        FrameQueue queue(1);
        StreamServer server(server_socket, queue, server_config);
        std::thread server_thread([&]() { server.run(g_done); });

        UdpSocket client_socket;
        client_socket.bind_port(0);
        client_socket.connect_to(server_addr);
        client_socket.set_recv_timeout(100);

        StreamClient client(client_socket, StreamClient::Config());
        client.set_terminate_handler([](int status) {
            std::cerr << "[RX] Stream ended (status " << status << ")" << std::endl;
            g_done = true;
        });
        client.connect();
        client.start();

        // Give the server a moment to register the client
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!server.has_clients() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (!server.has_clients()) {
            std::cerr << "[Loopback] Server never saw the client." << std::endl;
            g_done = true;
            queue.stop();
            server_thread.join();
            return 1;
        }

        auto start_time = std::chrono::steady_clock::now();
        std::thread producer(producer_thread_func, std::ref(queue), num_frames, frame_size);

        rx_drain(client, num_frames, frame_size);
        auto end_time = std::chrono::steady_clock::now();

        client.disconnect();
        g_done = true;
        queue.stop();
        producer.join();
        server_thread.join();

        double duration_sec = std::chrono::duration<double>(end_time - start_time).count();
        size_t lost = g_frames_queued > g_frames_received ? g_frames_queued - g_frames_received : 0;

        std::cout << std::fixed << std::setprecision(2);
        std::cout << "=========================================" << std::endl;
        std::cout << " Results " << std::endl;
        std::cout << " Time:            " << duration_sec << " s" << std::endl;
        std::cout << " Frames Sent:     " << server.frames_sent() << std::endl;
        std::cout << " Frames Received: " << g_frames_received << std::endl;
        std::cout << " Frames Lost:     " << lost << " ("
                  << (g_frames_queued > 0 ? 100.0 * lost / g_frames_queued : 0.0) << "%)" << std::endl;
        std::cout << " Not sequential:  " << client.frames_non_sequential() << std::endl;
        std::cout << " Throughput:      " << calculate_mbps(g_bytes_received, duration_sec) << " Mbps" << std::endl;
        std::cout << "=========================================" << std::endl;

        return lost == 0 ? 0 : 2;
    } catch (const std::runtime_error& e) {
        std::cerr << "[Loopback] " << e.what() << std::endl;
        return 1;
    }
}
