/**
 * @file Source_Frames.hpp
 * @brief StreamPU Source draining the client frame cache into a display buffer.
 */
#ifndef SOURCE_FRAMES_HPP_
#define SOURCE_FRAMES_HPP_

#include <vector>
#include <cstdint>
#include <iostream>
#include <chrono>
#include <thread>
#include <algorithm>
#include <streampu.hpp>

#include "StreamClient.hpp"
#include "FrameCodec.hpp"

namespace spu
{
namespace module
{

template <typename B = uint8_t>
class Source_Frames : public Source<B>
{
protected:
    StreamClient& client_;
    FrameDecoder& decoder_;
    Resolution display_;
    int timeout_ms_;
    std::vector<uint8_t> compressed_;
    RawImage decoded_;
    std::vector<uint8_t> last_;    // shown again when no new frame arrived
    size_t decode_errors_ = 0;

public:
    Source_Frames(StreamClient& client, FrameDecoder& decoder, const Resolution& display, int timeout_ms = 1000)
    : Source<B>(static_cast<int>(display.rgb_size())),
      client_(client),
      decoder_(decoder),
      display_(display),
      timeout_ms_(timeout_ms),
      last_(display.rgb_size(), 0)
    {
        const std::string name = "Source_Frames";
        this->set_name(name);
        this->set_short_name(name);
    }

    virtual ~Source_Frames() = default;

    virtual Source_Frames<B>* clone() const
    {
        // Several sources would steal frames from each other's cache.
        throw tools::runtime_error(__FILE__, __LINE__, __func__, "Cloning Source_Frames is not supported.");
    }

    size_t get_decode_errors() const { return decode_errors_; }

protected:
    void _generate(B *out_data, const size_t frame_id) override
    {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);

        while (std::chrono::steady_clock::now() < deadline) {
            if (client_.next_frame(compressed_)) {
                if (decoder_.decode(compressed_.data(), compressed_.size(), decoded_)) {
                    blit_centered(decoded_, last_.data(), display_);
                    break;
                }
                decode_errors_++;
                std::cerr << "[Client] Error decoding frame (" << compressed_.size() << " bytes)" << std::endl;
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }

        std::copy_n(last_.begin(), std::min(last_.size(), (size_t)this->max_data_size), out_data);
    }
};

}
}

#endif // SOURCE_FRAMES_HPP_
