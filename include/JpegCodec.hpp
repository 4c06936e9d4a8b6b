/**
 * @file JpegCodec.hpp
 * @brief libjpeg implementation of the frame encoder and decoder.
 */

#ifndef JPEG_CODEC_HPP
#define JPEG_CODEC_HPP

#include "FrameCodec.hpp"
#include <cstdio>
#include <cstdlib>
#include <csetjmp>
#include <jpeglib.h>

namespace jpeg_detail {

// libjpeg reports fatal errors through error_exit, which must not return.
struct ErrorMgr {
    jpeg_error_mgr pub;
    jmp_buf jb;
    char message[JMSG_LENGTH_MAX];
};

inline void error_exit_trampoline(j_common_ptr cinfo) {
    ErrorMgr* err = reinterpret_cast<ErrorMgr*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    longjmp(err->jb, 1);
}

// Corrupt-data warnings are expected on a lossy link, keep them quiet.
inline void silent_output_message(j_common_ptr) {}

} // namespace jpeg_detail

class JpegEncoder : public FrameEncoder {
private:
    int quality_;

public:
    explicit JpegEncoder(int quality = 25) : quality_(quality) {
        if (quality_ < 1 || quality_ > 100) {
            throw std::runtime_error("JpegEncoder: quality must be in [1, 100], got " + std::to_string(quality));
        }
    }

    int quality() const { return quality_; }

    std::vector<uint8_t> encode(const RawImage& image) override {
        if (image.width == 0 || image.height == 0 ||
            image.pixels.size() < static_cast<size_t>(image.width) * image.height * 3) {
            throw std::runtime_error("JpegEncoder: invalid image " +
                                     std::to_string(image.width) + "x" + std::to_string(image.height));
        }

        jpeg_compress_struct cinfo;
        jpeg_detail::ErrorMgr jerr;
        // libjpeg grows the buffer behind our back, still read after a longjmp
        unsigned char* volatile mem = nullptr;
        volatile unsigned long mem_size = 0;

        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = jpeg_detail::error_exit_trampoline;

        if (setjmp(jerr.jb)) {
            jpeg_destroy_compress(&cinfo);
            if (mem) std::free(mem);
            throw std::runtime_error(std::string("JpegEncoder: ") + jerr.message);
        }

        jpeg_create_compress(&cinfo);
        jpeg_mem_dest(&cinfo, const_cast<unsigned char**>(&mem),
                      const_cast<unsigned long*>(&mem_size));

        cinfo.image_width = image.width;
        cinfo.image_height = image.height;
        cinfo.input_components = 3;
        cinfo.in_color_space = JCS_RGB;
        jpeg_set_defaults(&cinfo);
        jpeg_set_quality(&cinfo, quality_, TRUE);

        jpeg_start_compress(&cinfo, TRUE);
        JSAMPROW row_pointer[1];
        const size_t stride = static_cast<size_t>(image.width) * 3;
        while (cinfo.next_scanline < cinfo.image_height) {
            row_pointer[0] = const_cast<JSAMPROW>(&image.pixels[cinfo.next_scanline * stride]);
            jpeg_write_scanlines(&cinfo, row_pointer, 1);
        }
        jpeg_finish_compress(&cinfo);

        std::vector<uint8_t> out(mem, mem + mem_size);
        jpeg_destroy_compress(&cinfo);
        std::free(mem);
        return out;
    }
};

class JpegDecoder : public FrameDecoder {
public:
    bool decode(const uint8_t* data, size_t size, RawImage& out) override {
        if (data == nullptr || size == 0) return false;

        jpeg_decompress_struct cinfo;
        jpeg_detail::ErrorMgr jerr;
        cinfo.err = jpeg_std_error(&jerr.pub);
        jerr.pub.error_exit = jpeg_detail::error_exit_trampoline;
        jerr.pub.output_message = jpeg_detail::silent_output_message;

        if (setjmp(jerr.jb)) {
            jpeg_destroy_decompress(&cinfo);
            return false;
        }

        jpeg_create_decompress(&cinfo);
        jpeg_mem_src(&cinfo, const_cast<unsigned char*>(data), static_cast<unsigned long>(size));
        if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
            jpeg_destroy_decompress(&cinfo);
            return false;
        }
        cinfo.out_color_space = JCS_RGB;
        jpeg_start_decompress(&cinfo);

        out.width = cinfo.output_width;
        out.height = cinfo.output_height;
        out.pixels.resize(static_cast<size_t>(out.width) * out.height * 3);

        const size_t stride = static_cast<size_t>(out.width) * 3;
        while (cinfo.output_scanline < cinfo.output_height) {
            JSAMPROW rowptr = &out.pixels[cinfo.output_scanline * stride];
            jpeg_read_scanlines(&cinfo, &rowptr, 1);
        }
        jpeg_finish_decompress(&cinfo);
        jpeg_destroy_decompress(&cinfo);
        return true;
    }
};

#endif // JPEG_CODEC_HPP
