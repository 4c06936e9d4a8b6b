/**
 * @file scs_client.cpp
 * @brief Screen streaming client: UDP ingest -> JPEG decode -> snapshot renderer.
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
#include "StreamClient.hpp"
#include "JpegCodec.hpp"
#include "FrameRenderer.hpp"
#include "Source_Frames.hpp"
#include "Sink_Render.hpp"

using namespace spu;
using namespace spu::module;
using namespace spu::runtime;

std::atomic<bool> g_stop_signal(false);
void signal_handler(int) { g_stop_signal = true; }

void print_help(char** argv) {
    std::cout << "Usage: " << argv[0] << " [options] [host:port]" << std::endl;
    std::cout << "  -a, --address         Server address host:port [127.0.0.1:8080]" << std::endl;
    std::cout << "  -l, --local-port      Local UDP port [8899]" << std::endl;
    std::cout << "  -r, --resolution      Display buffer WIDTHxHEIGHT [1920x1080]" << std::endl;
    std::cout << "  -o, --output          Snapshot file [frame.ppm]" << std::endl;
    std::cout << "  -f, --fps             Render rate [30]" << std::endl;
    std::cout << "  -k, --keepalive       Ping interval in ms [1000]" << std::endl;
    std::cout << "  -v, --verbose         Log every fragment and gap" << std::endl;
    std::cout << "  -h, --help            Show this help" << std::endl;
}

void monitor_thread(const StreamClient& client) {
    using namespace std::chrono;
    auto last_time = steady_clock::now();
    size_t last_bytes = 0;

    std::cout << std::fixed << std::setprecision(2);

    while (!g_stop_signal && client.is_running()) {
        std::this_thread::sleep_for(milliseconds(1000));

        auto now = steady_clock::now();
        double dt = duration_cast<duration<double>>(now - last_time).count();
        size_t current_bytes = client.ingest().bytes_received();

        double mbps = (static_cast<double>(current_bytes - last_bytes) * 8.0) / (dt * 1e6);

        std::cout << "\r[RX] Speed: " << std::setw(7) << mbps << " Mbps"
                  << " | Frames: " << client.frames_ready()
                  << " | Not sequential: " << client.frames_non_sequential()
                  << " | Discarded: " << client.ingest().datagrams_discarded() << std::flush;

        last_time = now;
        last_bytes = current_bytes;
    }
    std::cout << std::endl;
}

int main(int argc, char** argv)
{
    std::signal(SIGINT, signal_handler);

    std::string address = "127.0.0.1:8080";
    int local_port = 8899;
    std::string resolution = "1920x1080";
    std::string output = "frame.ppm";
    int fps = 30;
    StreamClient::Config config;

    struct option longopts[] = {
        { "address",     required_argument, NULL, 'a' },
        { "local-port",  required_argument, NULL, 'l' },
        { "resolution",  required_argument, NULL, 'r' },
        { "output",      required_argument, NULL, 'o' },
        { "fps",         required_argument, NULL, 'f' },
        { "keepalive",   required_argument, NULL, 'k' },
        { "verbose",     no_argument,       NULL, 'v' },
        { "help",        no_argument,       NULL, 'h' },
        { NULL,          0,                 NULL, 0   }
    };

    try {
        while (true) {
            const int opt = getopt_long(argc, argv, "a:l:r:o:f:k:vh", longopts, 0);
            if (opt == -1) break;
            switch (opt) {
                case 'a': address = std::string(optarg); break;
                case 'l': local_port = std::stoi(optarg); break;
                case 'r': resolution = std::string(optarg); break;
                case 'o': output = std::string(optarg); break;
                case 'f': fps = std::stoi(optarg); break;
                case 'k': config.keepalive_ms = std::stoi(optarg); break;
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
    if (optind < argc) address = argv[optind];

    if (local_port < 0 || local_port > 65535 || fps <= 0 || config.keepalive_ms <= 0) {
        std::cerr << "Invalid local port, fps or keepalive." << std::endl;
        return 1;
    }

    Endpoint server;
    Resolution display;
    try {
        server = Endpoint::parse(address);
        display = Resolution::parse(resolution);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::cout << "--- Client Configuration ---" << std::endl;
    std::cout << "Server:     " << server.to_string() << std::endl;
    std::cout << "Local port: " << local_port << std::endl;
    std::cout << "Display:    " << display.to_string() << std::endl;
    std::cout << "Output:     " << output << std::endl;
    std::cout << "Keepalive:  " << config.keepalive_ms << " ms" << std::endl;
    std::cout << "----------------------------" << std::endl;

    try {
        UdpSocket socket;
        socket.bind_port(static_cast<uint16_t>(local_port));
        socket.connect_to(server);
        // Bounds how long abort() waits for the ingest thread
        socket.set_recv_timeout(100);

        int actual_rcv_buf = socket.kernel_rcvbuf();
        if (actual_rcv_buf >= 0) {
            std::cout << "[Client] Kernel RCVBUF: " << (actual_rcv_buf / 1024 / 1024) << " MB" << std::endl;
        }

        StreamClient client(socket, config);
        client.connect();
        std::cout << "[Client] Connected to server at " << server.to_string() << std::endl;
        client.start();

        // Modules
        JpegDecoder decoder;
        PpmSnapshotRenderer renderer(output, static_cast<size_t>(fps));
        Source_Frames<uint8_t> frames(client, decoder, display, 1000 / fps);
        Sink_Render<uint8_t>   render(renderer, display);

        // Binding
        render["send::in_data"] = frames["generate::out_data"];

        // Sequence
        Sequence seq_display(frames("generate"));
        for (auto& mod : seq_display.get_modules<Module>(false))
            for (auto& tsk : mod->tasks) tsk->set_fast(true);

        std::thread monitor(monitor_thread, std::cref(client));

        bool stream_closed = false;
        try {
            seq_display.exec([&]() {
                if (!client.keepalive()) {
                    std::cerr << "[Client] Error sending keepalive to server" << std::endl;
                    stream_closed = true;
                }
                return stream_closed || g_stop_signal.load() || !client.is_running();
            });
        } catch (const std::exception& e) {
            client.abort();
            g_stop_signal = true;
            if (monitor.joinable()) monitor.join();
            std::cerr << "[Client] Display loop failed: " << e.what() << std::endl;
            return 1;
        }

        if (stream_closed) {
            client.abort();
        } else {
            client.disconnect();
        }
        g_stop_signal = true;
        if (monitor.joinable()) monitor.join();

        std::cout << "[Client] Stopped. Frames: " << client.frames_ready()
                  << ", not sequential: " << client.frames_non_sequential()
                  << ", decode errors: " << frames.get_decode_errors() << std::endl;
        if (stream_closed) return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "[Client] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
