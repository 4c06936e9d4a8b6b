#include <iostream>
#include <vector>
#include <atomic>
#include <thread>
#include <chrono>
#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>

#include "test_utils.hpp"
#include "IngestLoop.hpp"
#include "StreamClient.hpp"

// --------------------------------------------------------------------------
// HELPERS
// --------------------------------------------------------------------------

static std::vector<uint8_t> wire(uint32_t frame_id, uint8_t index, size_t payload_size) {
    return make_packet(frame_id, index, payload_size, index).encode();
}

// Runs 'body' in a child process and returns its exit status, or -1 if it
// did not exit normally within 'timeout_ms'.
template <typename F>
static int exit_status_of(F body, int timeout_ms) {
    pid_t pid = fork();
    if (pid < 0) return -1;
    if (pid == 0) {
        body();
        _exit(42); // body is expected to terminate the process itself
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
    return -1;
}

// --------------------------------------------------------------------------
// TEST CASES
// --------------------------------------------------------------------------

void test_filters_datagrams() {
    std::cout << "\n--- TEST: Datagram Filtering ---" << std::endl;
    ScriptedChannel channel;
    SharedFrameCachePtr cache = std::make_shared<SharedFrameCache>();
    IngestLoop ingest(channel, cache);

    channel.then_datagram(std::vector<uint8_t>(1, SCS_CTRL_GENERAL_OK)); // control ack
    channel.then_datagram(std::vector<uint8_t>(SCS_UDP_META_SIZE - 1, 0)); // junk
    channel.then_error(EAGAIN);
    channel.then_datagram(wire(3, 0, SCS_UDP_MAX_PAYLOAD));
    channel.then_datagram(std::vector<uint8_t>(SCS_UDP_CHUNK_SIZE + 1, 0)); // oversize
    channel.then_error(EINTR);
    channel.then_datagram(wire(3, 1, 12));

    IngestLoop::Exit exit = IngestLoop::Exit::STOPPED;
    bool alive = true;
    for (int i = 0; i < 7 && alive; ++i) alive = ingest.step(exit);

    ASSERT_TRUE(alive, "Short, oversize and would-block datagrams never end the loop");
    ASSERT_TRUE(ingest.datagrams_discarded() == 3, "Three datagrams discarded");
    ASSERT_TRUE(ingest.fragments_received() == 2, "Two fragments accepted");

    FrameCache::Result res = cache->get_frame();
    ASSERT_TRUE(res.status == FrameCache::Status::READY && res.frame_id == 3 &&
                res.data.size() == SCS_UDP_MAX_PAYLOAD + 12, "Accepted fragments reassemble");

    // Two valid fragments glued into one datagram are not split apart
    std::vector<uint8_t> glued = wire(4, 0, SCS_UDP_MAX_PAYLOAD);
    std::vector<uint8_t> tail = wire(4, 1, 12);
    glued.insert(glued.end(), tail.begin(), tail.end());
    channel.then_datagram(glued);
    ASSERT_TRUE(ingest.step(exit), "Glued datagram does not end the loop");
    ASSERT_TRUE(ingest.datagrams_discarded() == 4 && ingest.fragments_received() == 2,
                "Glued datagram discarded whole");
    ASSERT_TRUE(cache->get_frame().status != FrameCache::Status::READY, "No frame built from it");
}

void test_exit_classification() {
    std::cout << "\n--- TEST: Exit Classification ---" << std::endl;
    SharedFrameCachePtr cache = std::make_shared<SharedFrameCache>();
    std::atomic<bool> running(true);

    ScriptedChannel closed;
    closed.then_datagram(wire(1, 0, 10));
    closed.then_datagram(std::vector<uint8_t>());
    IngestLoop a(closed, cache);
    ASSERT_TRUE(a.run(running) == IngestLoop::Exit::SERVER_CLOSED, "Zero-length read ends the loop");

    ScriptedChannel reset;
    reset.then_error(ECONNREFUSED);
    IngestLoop b(reset, cache);
    ASSERT_TRUE(b.run(running) == IngestLoop::Exit::CONNECTION_RESET, "Refused is a reset");

    ScriptedChannel broken;
    broken.then_error(EBADF);
    IngestLoop c(broken, cache);
    ASSERT_TRUE(c.run(running) == IngestLoop::Exit::IO_ERROR, "Other errors are I/O errors");
    ASSERT_TRUE(c.last_error() == EBADF, "errno is kept");

    ASSERT_TRUE(IngestLoop::exit_status(IngestLoop::Exit::SERVER_CLOSED) == 0, "Server closed exits 0");
    ASSERT_TRUE(IngestLoop::exit_status(IngestLoop::Exit::CONNECTION_RESET) == 0, "Reset exits 0");
    ASSERT_TRUE(IngestLoop::exit_status(IngestLoop::Exit::IO_ERROR) == 1, "I/O error exits 1");
}

void test_stop_flag() {
    std::cout << "\n--- TEST: Stop Flag ---" << std::endl;
    ScriptedChannel idle; // would-block forever
    SharedFrameCachePtr cache = std::make_shared<SharedFrameCache>();
    IngestLoop ingest(idle, cache);
    std::atomic<bool> running(true);

    IngestLoop::Exit exit = IngestLoop::Exit::IO_ERROR;
    std::thread t([&]() { exit = ingest.run(running); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    running = false;
    t.join();
    ASSERT_TRUE(exit == IngestLoop::Exit::STOPPED, "Clearing 'running' stops the loop");
}

void test_client_terminates_process() {
    std::cout << "\n--- TEST: Client Process Termination ---" << std::endl;

    int status = exit_status_of([]() {
        ScriptedChannel channel;
        channel.then_datagram(wire(1, 0, 10));
        channel.then_datagram(std::vector<uint8_t>());
        StreamClient client(channel, StreamClient::Config());
        client.connect();
        client.start();
        std::this_thread::sleep_for(std::chrono::seconds(5));
    }, 3000);
    ASSERT_TRUE(status == IngestLoop::EXIT_SERVER_CLOSED, "Zero-length read exits with status 0, no hang");

    status = exit_status_of([]() {
        ScriptedChannel channel;
        channel.then_error(EIO);
        StreamClient client(channel, StreamClient::Config());
        client.start();
        std::this_thread::sleep_for(std::chrono::seconds(5));
    }, 3000);
    ASSERT_TRUE(status == IngestLoop::EXIT_IO_ERROR, "Receive error exits with status 1");
}

void test_client_lifecycle() {
    std::cout << "\n--- TEST: Client Lifecycle ---" << std::endl;
    ScriptedChannel channel;
    channel.then_datagram(wire(5, 0, SCS_UDP_MAX_PAYLOAD));
    channel.then_datagram(wire(5, 1, 3));
    channel.then_datagram(wire(6, 1, 3)); // frame 6 lost fragment 0

    StreamClient::Config config;
    config.keepalive_ms = 10;
    StreamClient client(channel, config);

    std::atomic<int> terminated(-1);
    client.set_terminate_handler([&](int status) { terminated = status; });
    client.connect();
    client.start();

    std::vector<uint8_t> frame;
    bool got = false;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!got && std::chrono::steady_clock::now() < deadline) {
        got = client.next_frame(frame);
    }
    ASSERT_TRUE(got && frame.size() == SCS_UDP_MAX_PAYLOAD + 3, "Consumer drains the reassembled frame");

    while (client.frames_non_sequential() == 0 && std::chrono::steady_clock::now() < deadline) {
        client.next_frame(frame);
    }
    for (int i = 0; i < 10; ++i) client.next_frame(frame);
    ASSERT_TRUE(client.frames_non_sequential() == 1, "Gappy frame counted once");

    std::this_thread::sleep_for(std::chrono::milliseconds(15));
    ASSERT_TRUE(client.keepalive(), "Keepalive send succeeds");
    client.disconnect();
    ASSERT_TRUE(!client.is_running(), "Ingest thread stopped");
    ASSERT_TRUE(terminated == -1, "Clean shutdown does not terminate");

    const std::vector<std::vector<uint8_t>>& sent = channel.sent_connected;
    ASSERT_TRUE(sent.size() == 3, "Three control messages sent");
    ASSERT_TRUE(sent[0] == std::vector<uint8_t>(1, SCS_CTRL_NEW_CONNECTION), "NewConnection first");
    ASSERT_TRUE(sent[1] == std::vector<uint8_t>(1, SCS_CTRL_PING), "Then a Ping");
    ASSERT_TRUE(sent[2] == std::vector<uint8_t>(1, SCS_CTRL_DISCONNECTION), "Disconnection last");
}

int main() {
    test_filters_datagrams();
    test_exit_classification();
    test_stop_flag();
    test_client_terminates_process();
    test_client_lifecycle();

    std::cout << "\n[ALL TESTS PASSED]" << std::endl;
    return 0;
}
