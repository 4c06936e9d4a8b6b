/**
 * @file Source_Capture.hpp
 * @brief StreamPU Source wrapper for a FrameGrabber, paced to a frame rate.
 */
#ifndef SOURCE_CAPTURE_HPP_
#define SOURCE_CAPTURE_HPP_

#include <vector>
#include <cstdint>
#include <chrono>
#include <thread>
#include <algorithm>
#include <streampu.hpp>

#include "FrameGrabber.hpp"

namespace spu
{
namespace module
{

template <typename B = uint8_t>
class Source_Capture : public Source<B>
{
protected:
    FrameGrabber& grabber_;
    RawImage image_;
    std::chrono::microseconds period_;
    std::chrono::steady_clock::time_point next_tick_;
    size_t failed_grabs_ = 0;

public:
    Source_Capture(FrameGrabber& grabber, const int fps)
    : Source<B>(static_cast<int>(grabber.geometry().rgb_size())),
      grabber_(grabber),
      image_(grabber.geometry().width, grabber.geometry().height),
      period_(1000000 / (fps > 0 ? fps : 1)),
      next_tick_(std::chrono::steady_clock::now())
    {
        const std::string name = "Source_Capture";
        this->set_name(name);
        this->set_short_name(name);
    }

    virtual ~Source_Capture() = default;

    virtual Source_Capture<B>* clone() const
    {
        // The grabber is a single hardware resource.
        throw tools::runtime_error(__FILE__, __LINE__, __func__, "Cloning Source_Capture is not supported.");
    }

    size_t get_failed_grabs() const { return failed_grabs_; }

protected:
    void _generate(B *out_data, const size_t frame_id) override
    {
        // Pace capture to the target frame rate
        std::this_thread::sleep_until(next_tick_);
        next_tick_ += period_;
        auto now = std::chrono::steady_clock::now();
        if (next_tick_ < now) next_tick_ = now; // do not try to catch up after a stall

        // On a transient failure the previous image is sent again
        if (!grabber_.grab(image_)) failed_grabs_++;

        std::copy_n(image_.pixels.begin(), std::min(image_.pixels.size(), (size_t)this->max_data_size), out_data);
    }
};

}
}

#endif // SOURCE_CAPTURE_HPP_
