/**
 * @file FrameCodec.hpp
 * @brief Raw image type and the compression interfaces used around the stream.
 */

#ifndef FRAME_CODEC_HPP
#define FRAME_CODEC_HPP

#include <cstdint>
#include <vector>
#include <string>
#include <stdexcept>
#include <algorithm>

struct Resolution {
    uint32_t width = 0;
    uint32_t height = 0;

    /**
     * @brief Parses "WIDTHxHEIGHT", e.g. "1920x1080".
     */
    static Resolution parse(const std::string& text) {
        size_t x = text.find('x');
        if (x == std::string::npos) x = text.find('X');
        if (x == std::string::npos || x == 0 || x + 1 == text.size()) {
            throw std::runtime_error("Resolution: expected WIDTHxHEIGHT, got '" + text + "'");
        }
        Resolution r;
        try {
            r.width = static_cast<uint32_t>(std::stoul(text.substr(0, x)));
            r.height = static_cast<uint32_t>(std::stoul(text.substr(x + 1)));
        } catch (const std::exception&) {
            throw std::runtime_error("Resolution: invalid number in '" + text + "'");
        }
        if (r.width == 0 || r.height == 0 || r.width > 16384 || r.height > 16384) {
            throw std::runtime_error("Resolution: out of range '" + text + "'");
        }
        return r;
    }

    size_t rgb_size() const { return static_cast<size_t>(width) * height * 3; }

    std::string to_string() const {
        return std::to_string(width) + "x" + std::to_string(height);
    }
};

// Packed 8-bit RGB, row-major, no padding.
struct RawImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> pixels;

    RawImage() = default;
    RawImage(uint32_t w, uint32_t h) : width(w), height(h), pixels(static_cast<size_t>(w) * h * 3) {}

    bool empty() const { return pixels.empty(); }
};

/**
 * @brief Copies 'src' centered into a 'dst' buffer of 'dst_size' pixels,
 * cropping what does not fit and filling the margins with black.
 */
inline void blit_centered(const RawImage& src, uint8_t* dst, const Resolution& dst_size) {
    const size_t dst_stride = static_cast<size_t>(dst_size.width) * 3;
    std::fill(dst, dst + dst_stride * dst_size.height, 0);
    if (src.empty()) return;

    const uint32_t copy_w = src.width < dst_size.width ? src.width : dst_size.width;
    const uint32_t copy_h = src.height < dst_size.height ? src.height : dst_size.height;
    const uint32_t src_x = (src.width - copy_w) / 2;
    const uint32_t src_y = (src.height - copy_h) / 2;
    const uint32_t dst_x = (dst_size.width - copy_w) / 2;
    const uint32_t dst_y = (dst_size.height - copy_h) / 2;
    const size_t src_stride = static_cast<size_t>(src.width) * 3;

    for (uint32_t row = 0; row < copy_h; ++row) {
        const uint8_t* from = &src.pixels[(src_y + row) * src_stride + src_x * 3];
        uint8_t* to = dst + (dst_y + row) * dst_stride + dst_x * 3;
        std::copy(from, from + static_cast<size_t>(copy_w) * 3, to);
    }
}

class FrameEncoder {
public:
    virtual ~FrameEncoder() {}

    /**
     * @throws std::runtime_error if the image cannot be compressed.
     */
    virtual std::vector<uint8_t> encode(const RawImage& image) = 0;
};

class FrameDecoder {
public:
    virtual ~FrameDecoder() {}

    /**
     * @return false if 'data' is not a decodable image.
     */
    virtual bool decode(const uint8_t* data, size_t size, RawImage& out) = 0;
};

#endif // FRAME_CODEC_HPP
