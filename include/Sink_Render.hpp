/**
 * @file Sink_Render.hpp
 * @brief StreamPU Sink handing display buffers to a FrameRenderer.
 */
#ifndef SINK_RENDER_HPP_
#define SINK_RENDER_HPP_

#include <cstdint>
#include <iostream>
#include <algorithm>
#include <streampu.hpp>

#include "FrameRenderer.hpp"

namespace spu
{
namespace module
{

template <typename B = uint8_t>
class Sink_Render : public Sink<B>
{
protected:
    FrameRenderer& renderer_;
    RawImage image_;

public:
    Sink_Render(FrameRenderer& renderer, const Resolution& display)
    : Sink<B>(static_cast<int>(display.rgb_size())),
      renderer_(renderer),
      image_(display.width, display.height)
    {
        const std::string name = "Sink_Render";
        this->set_name(name);
        this->set_short_name(name);
    }

    virtual ~Sink_Render() = default;

    virtual Sink_Render<B>* clone() const
    {
        std::cerr << "Fatal: cloning Sink_Render is not allowed." << std::endl;
        std::terminate();
    }

protected:
    void _send(const B *in_data, const size_t frame_id) override
    {
        std::copy_n(in_data, image_.pixels.size(), image_.pixels.begin());
        try {
            renderer_.render(image_);
        } catch (const std::runtime_error& e) {
            std::cerr << "[Render] " << e.what() << std::endl;
        }
    }
};

}
}

#endif // SINK_RENDER_HPP_
