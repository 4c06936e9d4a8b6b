/**
 * @file scs_server.cpp
 * @brief Screen streaming server: capture -> JPEG -> UDP fan-out to every client.
 */

#include <iostream>
#include <string>
#include <stdexcept>
#include <atomic>
#include <thread>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <functional>
#include <getopt.h>

#include <streampu.hpp>
#include "UdpSocket.hpp"
#include "StreamServer.hpp"
#include "JpegCodec.hpp"
#include "Source_Capture.hpp"
#include "Sink_Encoder.hpp"

using namespace spu;
using namespace spu::module;
using namespace spu::runtime;

std::atomic<bool> g_stop_signal(false);
void signal_handler(int) { g_stop_signal = true; }

void print_help(char** argv) {
    std::cout << "Usage: " << argv[0] << " [options]" << std::endl;
    std::cout << "  -p, --port            Listening port [8080]" << std::endl;
    std::cout << "  -q, --quality         JPEG quality 1-100 [25]" << std::endl;
    std::cout << "  -r, --resolution      Capture geometry WIDTHxHEIGHT [1920x1080]" << std::endl;
    std::cout << "  -f, --fps             Capture rate [30]" << std::endl;
    std::cout << "  -t, --duration        Stop after N seconds, 0 = forever [0]" << std::endl;
    std::cout << "  -s, --sequential      Deliver to clients one after the other" << std::endl;
    std::cout << "  -v, --verbose         Log every control message and frame" << std::endl;
    std::cout << "  -h, --help            Show this help" << std::endl;
}

void monitor_thread(const StreamServer& server) {
    using namespace std::chrono;
    auto last_time = steady_clock::now();
    size_t last_bytes = 0;

    std::cout << std::fixed << std::setprecision(2);

    while (!g_stop_signal) {
        std::this_thread::sleep_for(milliseconds(1000));

        auto now = steady_clock::now();
        double dt = duration_cast<duration<double>>(now - last_time).count();
        size_t current_bytes = server.bytes_sent();

        double mbps = (static_cast<double>(current_bytes - last_bytes) * 8.0) / (dt * 1e6);

        std::cout << "\r[TX] Speed: " << std::setw(7) << mbps << " Mbps"
                  << " | Clients: " << server.client_count()
                  << " | Frames: " << server.frames_sent()
                  << " | Skipped: " << server.frames_skipped() << std::flush;

        last_time = now;
        last_bytes = current_bytes;
    }
    std::cout << std::endl;
}

int main(int argc, char** argv)
{
    std::signal(SIGINT, signal_handler);

    int port = 8080;
    int quality = 25;
    std::string resolution = "1920x1080";
    StreamServer::Config config;

    struct option longopts[] = {
        { "port",        required_argument, NULL, 'p' },
        { "quality",     required_argument, NULL, 'q' },
        { "resolution",  required_argument, NULL, 'r' },
        { "fps",         required_argument, NULL, 'f' },
        { "duration",    required_argument, NULL, 't' },
        { "sequential",  no_argument,       NULL, 's' },
        { "verbose",     no_argument,       NULL, 'v' },
        { "help",        no_argument,       NULL, 'h' },
        { NULL,          0,                 NULL, 0   }
    };

    try {
        while (true) {
            const int opt = getopt_long(argc, argv, "p:q:r:f:t:svh", longopts, 0);
            if (opt == -1) break;
            switch (opt) {
                case 'p': port = std::stoi(optarg); break;
                case 'q': quality = std::stoi(optarg); break;
                case 'r': resolution = std::string(optarg); break;
                case 'f': config.fps = std::stoi(optarg); break;
                case 't': config.duration_s = std::stoi(optarg); break;
                case 's': config.parallel = false; break;
                case 'v': config.verbose = true; break;
                case 'h': print_help(argv); return 0;
                default: print_help(argv); return 1;
            }
        }
    } catch (const std::logic_error&) {
        std::cerr << "Invalid numeric argument." << std::endl;
        print_help(argv);
        return 1;
    }

    if (port <= 0 || port > 65535 || config.fps <= 0) {
        std::cerr << "Invalid port or fps." << std::endl;
        return 1;
    }

    Resolution geometry;
    try {
        geometry = Resolution::parse(resolution);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::cout << "--- Server Configuration ---" << std::endl;
    std::cout << "Port:       " << port << std::endl;
    std::cout << "Geometry:   " << geometry.to_string() << std::endl;
    std::cout << "Quality:    " << quality << std::endl;
    std::cout << "FPS:        " << config.fps << std::endl;
    std::cout << "Duration:   " << (config.duration_s > 0 ? std::to_string(config.duration_s) + " s" : "unlimited") << std::endl;
    std::cout << "Delivery:   " << (config.parallel ? "parallel" : "sequential") << std::endl;
    std::cout << "----------------------------" << std::endl;

    try {
        UdpSocket socket;
        socket.bind_port(static_cast<uint16_t>(port));
        socket.set_nonblocking(true);

        FrameQueue queue(1);
        StreamServer server(socket, queue, config);

        // Modules
        TestPatternGrabber grabber(geometry);
        JpegEncoder encoder(quality);
        Source_Capture<uint8_t> capture(grabber, config.fps);
        Sink_Encoder<uint8_t>   compress(encoder, queue, geometry,
                                         [&server]() { return server.has_clients(); },
                                         config.verbose);

        // Binding
        compress["send::in_data"] = capture["generate::out_data"];

        // Sequence
        Sequence seq_capture(capture("generate"));
        for (auto& mod : seq_capture.get_modules<Module>(false))
            for (auto& tsk : mod->tasks) tsk->set_fast(true);

        std::cout << "[Server] Waiting for clients on port " << port << "..." << std::endl;

        std::thread capture_thread([&]() {
            seq_capture.exec([&]() { return g_stop_signal.load(); });
        });
        std::thread monitor(monitor_thread, std::cref(server));

        auto shutdown = [&]() {
            g_stop_signal = true;
            queue.stop();
            if (capture_thread.joinable()) capture_thread.join();
            if (monitor.joinable()) monitor.join();
        };

        try {
            server.run(g_stop_signal);
        } catch (const std::exception& e) {
            shutdown();
            std::cerr << "[Server] Delivery loop failed: " << e.what() << std::endl;
            return 1;
        }
        shutdown();

        std::cout << "[Server] Stopped. Frames sent: " << server.frames_sent()
                  << ", skipped: " << server.frames_skipped()
                  << ", failed grabs: " << capture.get_failed_grabs() << std::endl;
    } catch (const std::runtime_error& e) {
        std::cerr << "[Server] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
