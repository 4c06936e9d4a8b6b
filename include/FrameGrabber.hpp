/**
 * @file FrameGrabber.hpp
 * @brief Source of raw frames on the server side.
 */

#ifndef FRAME_GRABBER_HPP
#define FRAME_GRABBER_HPP

#include "FrameCodec.hpp"

class FrameGrabber {
public:
    virtual ~FrameGrabber() {}

    virtual Resolution geometry() const = 0;

    /**
     * @brief Captures the next frame into 'out' (sized to geometry()).
     * @return false on a transient failure (timeout, access lost), the
     * caller simply tries again on the next tick.
     */
    virtual bool grab(RawImage& out) = 0;
};

/**
 * @brief Synthetic moving color bars, stands in for a screen capturer.
 */
class TestPatternGrabber : public FrameGrabber {
private:
    Resolution geometry_;
    uint32_t tick_ = 0;

public:
    explicit TestPatternGrabber(const Resolution& geometry) : geometry_(geometry) {}

    Resolution geometry() const override { return geometry_; }

    bool grab(RawImage& out) override {
        if (out.width != geometry_.width || out.height != geometry_.height) {
            out = RawImage(geometry_.width, geometry_.height);
        }

        static const uint8_t bars[8][3] = {
            {255, 255, 255}, {255, 255, 0}, {0, 255, 255}, {0, 255, 0},
            {255, 0, 255},   {255, 0, 0},   {0, 0, 255},   {0, 0, 0}
        };

        const uint32_t w = geometry_.width;
        const uint32_t h = geometry_.height;
        const uint32_t bar_width = w / 8 == 0 ? 1 : w / 8;
        const uint32_t band = h - h / 8; // bottom band: moving gradient

        for (uint32_t y = 0; y < h; ++y) {
            uint8_t* row = &out.pixels[static_cast<size_t>(y) * w * 3];
            for (uint32_t x = 0; x < w; ++x) {
                uint8_t* px = row + x * 3;
                if (y < band) {
                    const uint8_t* c = bars[((x + tick_ * 4) / bar_width) % 8];
                    px[0] = c[0];
                    px[1] = c[1];
                    px[2] = c[2];
                } else {
                    const uint8_t v = static_cast<uint8_t>((x + tick_ * 8) & 0xFF);
                    px[0] = v;
                    px[1] = v;
                    px[2] = v;
                }
            }
        }
        tick_++;
        return true;
    }
};

#endif // FRAME_GRABBER_HPP
