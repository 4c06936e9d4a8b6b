/**
 * @file Sink_Encoder.hpp
 * @brief StreamPU Sink that compresses raw frames and queues them for delivery.
 */
#ifndef SINK_ENCODER_HPP_
#define SINK_ENCODER_HPP_

#include <vector>
#include <cstdint>
#include <string>
#include <iostream>
#include <functional>
#include <algorithm>
#include <streampu.hpp>

#include "FrameCodec.hpp"
#include "FrameIdClock.hpp"
#include "FrameQueue.hpp"

namespace spu
{
namespace module
{

template <typename B = uint8_t>
class Sink_Encoder : public Sink<B>
{
protected:
    FrameEncoder& encoder_;
    FrameQueue& queue_;
    FrameIdClock clock_;
    RawImage image_;
    std::function<bool()> has_clients_;
    bool verbose_;
    size_t frames_queued_ = 0;
    size_t frames_skipped_ = 0;

public:
    /**
     * @param has_clients When it returns false the frame is dropped before
     *                    compression, nobody would receive it.
     *
     * A frame is also dropped uncompressed while the previous one still
     * waits in the queue.
     */
    Sink_Encoder(FrameEncoder& encoder, FrameQueue& queue, const Resolution& geometry,
                 std::function<bool()> has_clients, bool verbose = false)
    : Sink<B>(static_cast<int>(geometry.rgb_size())),
      encoder_(encoder),
      queue_(queue),
      image_(geometry.width, geometry.height),
      has_clients_(has_clients),
      verbose_(verbose)
    {
        const std::string name = "Sink_Encoder";
        this->set_name(name);
        this->set_short_name(name);
    }

    virtual ~Sink_Encoder() = default;

    virtual Sink_Encoder<B>* clone() const
    {
        // Frame ids must come from a single clock.
        std::cerr << "Fatal: cloning Sink_Encoder is not allowed." << std::endl;
        std::terminate();
    }

protected:
    void _send(const B *in_data, const size_t frame_id) override
    {
        if ((has_clients_ && !has_clients_()) || !queue_.empty()) {
            frames_skipped_++;
            return;
        }

        std::copy_n(in_data, image_.pixels.size(), image_.pixels.begin());

        EncodedFrame frame;
        try {
            frame.data = encoder_.encode(image_);
        } catch (const std::runtime_error& e) {
            std::cerr << "[Encoder] " << e.what() << std::endl;
            return;
        }
        frame.frame_id = clock_.next();

        if (verbose_) {
            std::cout << "[Encoder] Frame " << frame.frame_id << " : raw " << image_.pixels.size()
                      << " -> compressed " << frame.data.size() << std::endl;
        }

        // Only this sink pushes, so a refusal means the queue was stopped
        if (queue_.try_push(std::move(frame))) {
            frames_queued_++;
        } else if (verbose_) {
            std::cout << "[Encoder] Queue stopped, frame dropped." << std::endl;
        }
    }

public:
    size_t get_frames_queued() const { return frames_queued_; }
    size_t get_frames_skipped() const { return frames_skipped_; }
};

}
}

#endif // SINK_ENCODER_HPP_
