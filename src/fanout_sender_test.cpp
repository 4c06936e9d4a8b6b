#include <iostream>
#include <vector>

#include "test_utils.hpp"
#include "FanoutSender.hpp"

// --------------------------------------------------------------------------
// HELPERS
// --------------------------------------------------------------------------

static std::vector<uint8_t> make_frame(size_t size) {
    std::vector<uint8_t> frame(size);
    for (size_t i = 0; i < size; ++i) frame[i] = static_cast<uint8_t>(i * 7);
    return frame;
}

// True if 'datagrams' are the fragments 0..n-1 of 'frame_id' in order and
// rebuild 'frame'.
static bool received_in_order(const std::vector<std::vector<uint8_t>>& datagrams,
                              uint32_t frame_id, const std::vector<uint8_t>& frame) {
    std::vector<uint8_t> rebuilt;
    for (size_t i = 0; i < datagrams.size(); ++i) {
        ScsPacket p = ScsPacket::decode(datagrams[i]);
        if (p.index != i || p.frame_id != frame_id) return false;
        rebuilt.insert(rebuilt.end(), p.payload.begin(), p.payload.end());
    }
    return rebuilt == frame;
}

// --------------------------------------------------------------------------
// TEST CASES
// --------------------------------------------------------------------------

void test_partial_failure(bool parallel) {
    std::cout << "\n--- TEST: Partial Failure (" << (parallel ? "parallel" : "sequential") << ") ---" << std::endl;
    RecordingChannel channel;
    FanoutSender sender(channel, parallel);
    ClientRegistry registry;

    Endpoint c1(0x0A000001, 7001), c2(0x0A000002, 7002), c3(0x0A000003, 7003);
    registry.add(c1);
    registry.add(c2);
    registry.add(c3);
    channel.failing.insert(c2);

    std::vector<uint8_t> frame = make_frame(3 * SCS_UDP_MAX_PAYLOAD + 1234);
    FanoutSender::SweepReport report = sender.deliver(frame, 77, registry);

    ASSERT_TRUE(report.fragment_count == 4, "Frame split into 4 fragments");
    ASSERT_TRUE(registry.size() == 2 && registry.contains(c1) && registry.contains(c3) && !registry.contains(c2),
                "Registry keeps clients 1 and 3 only");
    ASSERT_TRUE(report.removed.size() == 1 && report.removed[0] == c2, "Client 2 reported as removed");
    ASSERT_TRUE(!report.no_viable_clients(), "Other clients are still viable");
    ASSERT_TRUE(received_in_order(channel.sent[c1], 77, frame), "Client 1 got every fragment in order");
    ASSERT_TRUE(received_in_order(channel.sent[c3], 77, frame), "Client 3 got every fragment in order");
    ASSERT_TRUE(channel.sent.count(c2) == 0, "Nothing recorded for client 2");
    ASSERT_TRUE(report.bytes_sent == 2 * (frame.size() + 4 * SCS_UDP_META_SIZE), "Byte count covers both clients");
}

void test_total_failure() {
    std::cout << "\n--- TEST: Every Client Fails ---" << std::endl;
    RecordingChannel channel;
    channel.fail_errno = EHOSTUNREACH;
    FanoutSender sender(channel);
    ClientRegistry registry;

    Endpoint c1(0x0A000001, 7001), c2(0x0A000002, 7002);
    registry.add(c1);
    registry.add(c2);
    channel.failing.insert(c1);
    channel.failing.insert(c2);

    FanoutSender::SweepReport report = sender.deliver(make_frame(1000), 5, registry);
    ASSERT_TRUE(report.no_viable_clients(), "No viable clients is signaled");
    ASSERT_TRUE(registry.empty(), "Registry is empty afterwards");
    ASSERT_TRUE(report.outcomes.size() == 2 && report.outcomes[0].error == EHOSTUNREACH, "errno is kept per client");
}

void test_no_clients() {
    std::cout << "\n--- TEST: Empty Registry ---" << std::endl;
    RecordingChannel channel;
    FanoutSender sender(channel);
    ClientRegistry registry;

    FanoutSender::SweepReport report = sender.deliver(make_frame(10), 1, registry);
    ASSERT_TRUE(report.outcomes.empty() && channel.sent.empty(), "Nothing is sent");
    ASSERT_TRUE(!report.no_viable_clients(), "An empty registry is not a failure");
}

void test_frame_too_large() {
    std::cout << "\n--- TEST: Frame Too Large ---" << std::endl;
    RecordingChannel channel;
    FanoutSender sender(channel);
    ClientRegistry registry;
    registry.add(Endpoint(0x0A000001, 7001));

    bool thrown = false;
    try {
        sender.deliver(make_frame(SCS_UDP_MAX_FRAME_SIZE + 1), 1, registry);
    } catch (const FrameTooLarge&) {
        thrown = true;
    }
    ASSERT_TRUE(thrown, "Oversized frame is surfaced");
    ASSERT_TRUE(channel.sent.empty() && registry.size() == 1, "Nothing sent, nobody removed");
}

int main() {
    test_partial_failure(true);
    test_partial_failure(false);
    test_total_failure();
    test_no_clients();
    test_frame_too_large();

    std::cout << "\n[ALL TESTS PASSED]" << std::endl;
    return 0;
}
