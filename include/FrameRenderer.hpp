/**
 * @file FrameRenderer.hpp
 * @brief Display side of the client.
 */

#ifndef FRAME_RENDERER_HPP
#define FRAME_RENDERER_HPP

#include "FrameCodec.hpp"
#include <fstream>
#include <cstdio>

class FrameRenderer {
public:
    virtual ~FrameRenderer() {}

    virtual void render(const RawImage& image) = 0;
};

/**
 * @brief Writes the latest frame as a binary PPM, replacing the previous one.
 *
 * The file is written to a temporary name then renamed, so a viewer polling
 * it never reads a half-written image.
 */
class PpmSnapshotRenderer : public FrameRenderer {
private:
    std::string path_;
    size_t every_;
    size_t count_ = 0;

public:
    /**
     * @param every Only every n-th frame is written (1 = all of them).
     */
    explicit PpmSnapshotRenderer(const std::string& path, size_t every = 1)
    : path_(path), every_(every == 0 ? 1 : every) {}

    void render(const RawImage& image) override {
        if (image.empty()) return;
        if (count_++ % every_ != 0) return;

        const std::string tmp = path_ + ".tmp";
        {
            std::ofstream out(tmp.c_str(), std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("PpmSnapshotRenderer: cannot open " + tmp);
            }
            out << "P6\n" << image.width << " " << image.height << "\n255\n";
            out.write(reinterpret_cast<const char*>(image.pixels.data()),
                      static_cast<std::streamsize>(image.pixels.size()));
            if (!out) {
                throw std::runtime_error("PpmSnapshotRenderer: write failed on " + tmp);
            }
        }
        if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
            throw std::runtime_error("PpmSnapshotRenderer: cannot rename " + tmp + " to " + path_);
        }
    }

    const std::string& path() const { return path_; }
    size_t frames_seen() const { return count_; }
};

#endif // FRAME_RENDERER_HPP
