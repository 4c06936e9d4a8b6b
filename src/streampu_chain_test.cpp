/**
 * @file streampu_chain_test.cpp
 * @brief StreamPU chains of both applications, driven without sockets.
 */

#include <iostream>
#include <vector>
#include <string>
#include <atomic>
#include <thread>
#include <chrono>

#include <streampu.hpp>

#include "test_utils.hpp"
#include "JpegCodec.hpp"
#include "FrameGrabber.hpp"
#include "FrameRenderer.hpp"
#include "FramePacketizer.hpp"
#include "StreamClient.hpp"
#include "Source_Capture.hpp"
#include "Sink_Encoder.hpp"
#include "Source_Frames.hpp"
#include "Sink_Render.hpp"

using namespace spu;
using namespace spu::module;
using namespace spu::runtime;

// --------------------------------------------------------------------------
// HELPERS
// --------------------------------------------------------------------------

// Keeps the last rendered image.
class LastImageRenderer : public FrameRenderer {
public:
    RawImage last;
    size_t rendered = 0;

    void render(const RawImage& image) override {
        last = image;
        rendered++;
    }
};

static void set_fast(Sequence& seq) {
    for (auto& mod : seq.get_modules<Module>(false))
        for (auto& tsk : mod->tasks) tsk->set_fast(true);
}

static void run_frames(Sequence& seq, size_t n_frames) {
    size_t counter = 0;
    seq.exec([&]() { return ++counter >= n_frames; });
}

// The datagrams a server would send for this frame.
static void script_frame(ScriptedChannel& channel, const std::vector<uint8_t>& data, uint32_t frame_id) {
    FramePacketizer packetizer;
    const size_t count = packetizer.prepare_frame(data.data(), data.size(), frame_id);
    const FramePacketizer::Packet* packets = packetizer.get_packets();
    for (size_t i = 0; i < count; ++i) {
        std::vector<uint8_t> datagram;
        for (int v = 0; v < 2; ++v) {
            const uint8_t* base = static_cast<const uint8_t*>(packets[i].iov[v].iov_base);
            datagram.insert(datagram.end(), base, base + packets[i].iov[v].iov_len);
        }
        channel.then_datagram(datagram);
    }
}

static RawImage solid(uint32_t w, uint32_t h, uint8_t r, uint8_t g, uint8_t b) {
    RawImage image(w, h);
    for (size_t i = 0; i < image.pixels.size(); i += 3) {
        image.pixels[i] = r;
        image.pixels[i + 1] = g;
        image.pixels[i + 2] = b;
    }
    return image;
}

static bool close_to(uint8_t value, uint8_t expected) {
    return (value > expected ? value - expected : expected - value) <= 16;
}

// --------------------------------------------------------------------------
// TEST CASES
// --------------------------------------------------------------------------

void test_capture_chain() {
    std::cout << "\n--- TEST: Capture -> Encoder -> Queue ---" << std::endl;
    const Resolution geometry = Resolution::parse("32x16");

    TestPatternGrabber grabber(geometry);
    JpegEncoder encoder(50);
    FrameQueue queue(1);
    std::atomic<bool> listening(false);

    Source_Capture<uint8_t> capture(grabber, 200);
    Sink_Encoder<uint8_t>   compress(encoder, queue, geometry,
                                     [&listening]() { return listening.load(); });
    compress["send::in_data"] = capture["generate::out_data"];

    Sequence seq(capture("generate"));
    set_fast(seq);

    run_frames(seq, 3);
    ASSERT_TRUE(queue.empty() && compress.get_frames_queued() == 0, "Nothing compressed without clients");
    ASSERT_TRUE(compress.get_frames_skipped() >= 1, "Frames without clients are counted as skipped");

    listening = true;
    const size_t skipped_before = compress.get_frames_skipped();
    run_frames(seq, 3);
    ASSERT_TRUE(queue.size() == 1 && compress.get_frames_queued() == 1,
                "One frame queued, the next ones wait for delivery");
    ASSERT_TRUE(compress.get_frames_skipped() > skipped_before, "Captures behind a queued frame are skipped");

    EncodedFrame first;
    ASSERT_TRUE(queue.pop(first), "Queued frame available");
    ASSERT_TRUE(first.data.size() > 2 && first.data[0] == 0xFF && first.data[1] == 0xD8, "Queued frame is a JPEG");

    JpegDecoder decoder;
    RawImage decoded;
    ASSERT_TRUE(decoder.decode(first.data.data(), first.data.size(), decoded), "Queued frame decodes");
    ASSERT_TRUE(decoded.width == 32 && decoded.height == 16, "Capture geometry preserved");

    run_frames(seq, 1);
    EncodedFrame second;
    ASSERT_TRUE(queue.pop(second) && compress.get_frames_queued() == 2, "Capture resumes once the queue drained");
    ASSERT_TRUE(second.frame_id != first.frame_id, "Every queued frame gets its own id");
    ASSERT_TRUE(capture.get_failed_grabs() == 0, "Test pattern never fails");
}

void test_display_chain() {
    std::cout << "\n--- TEST: Client -> Frames -> Render ---" << std::endl;
    const Resolution display = Resolution::parse("16x16");

    JpegEncoder encoder(90);
    std::vector<uint8_t> red = encoder.encode(solid(16, 16, 255, 0, 0));
    std::vector<uint8_t> corrupt(red.size(), 0x5A);

    ScriptedChannel channel;
    script_frame(channel, red, 1);
    script_frame(channel, corrupt, 2);

    StreamClient client(channel, StreamClient::Config());
    std::atomic<int> terminated(-1);
    client.set_terminate_handler([&](int status) { terminated = status; });
    client.start();

    JpegDecoder decoder;
    LastImageRenderer renderer;
    Source_Frames<uint8_t> frames(client, decoder, display, 200);
    Sink_Render<uint8_t>   render(renderer, display);
    render["send::in_data"] = frames["generate::out_data"];

    Sequence seq(frames("generate"));
    set_fast(seq);

    run_frames(seq, 1);
    ASSERT_TRUE(renderer.rendered == 1 && renderer.last.width == 16 && renderer.last.height == 16,
                "Decoded frame rendered at display size");
    ASSERT_TRUE(close_to(renderer.last.pixels[0], 255) && close_to(renderer.last.pixels[1], 0),
                "First frame shows red");

    run_frames(seq, 2);
    ASSERT_TRUE(frames.get_decode_errors() == 1, "Corrupt frame counted as a decode error");
    ASSERT_TRUE(renderer.rendered == 3, "Display keeps refreshing");
    ASSERT_TRUE(close_to(renderer.last.pixels[0], 255) && close_to(renderer.last.pixels[1], 0),
                "Last good image still shown after the corrupt one");

    client.abort();
    ASSERT_TRUE(terminated == -1, "Ingest stopped cleanly");
}

int main() {
    test_capture_chain();
    test_display_chain();

    std::cout << "\n[ALL TESTS PASSED]" << std::endl;
    return 0;
}
