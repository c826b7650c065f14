#pragma once
#include "core/error.hpp"
#include <cstdint>

extern "C" {
#include <libavutil/pixfmt.h>
}

struct SwsContext;

namespace rdc::codec {

// Owns one swscale context, rebuilt only when size or formats change.
// Same-size conversions only; scaling is out of scope here.
class ColorspaceConverter {
public:
    ColorspaceConverter() = default;
    ~ColorspaceConverter();

    ColorspaceConverter(const ColorspaceConverter&) = delete;
    ColorspaceConverter& operator=(const ColorspaceConverter&) = delete;

    Status convert(int32_t width, int32_t height,
                   AVPixelFormat src_format, const uint8_t* const src[], const int src_stride[],
                   AVPixelFormat dst_format, uint8_t* const dst[], const int dst_stride[]);

private:
    SwsContext* ctx_ = nullptr;
    int32_t width_ = 0;
    int32_t height_ = 0;
    AVPixelFormat src_format_ = AV_PIX_FMT_NONE;
    AVPixelFormat dst_format_ = AV_PIX_FMT_NONE;
};

// LIBSWSCALE_IDENT of the headers we were built against, e.g. "SwS8.1.100".
const char* swscale_ident() noexcept;

} // namespace rdc::codec
