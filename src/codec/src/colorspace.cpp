#include "codec/colorspace.hpp"
#include "core/log.hpp"
#include <string>

extern "C" {
#include <libswscale/swscale.h>
#include <libswscale/version.h>
#include <libavutil/pixdesc.h>
}

namespace rdc::codec {

namespace {

std::string format_name(AVPixelFormat fmt) {
    const char* n = av_get_pix_fmt_name(fmt);
    return n ? n : std::to_string(static_cast<int>(fmt));
}

} // namespace

ColorspaceConverter::~ColorspaceConverter() {
    if(ctx_) sws_freeContext(ctx_);
}

Status ColorspaceConverter::convert(int32_t width, int32_t height,
                                    AVPixelFormat src_format, const uint8_t* const src[], const int src_stride[],
                                    AVPixelFormat dst_format, uint8_t* const dst[], const int dst_stride[]) {
    // Recreate the context only when parameters change.
    if(!ctx_ || width_ != width || height_ != height || src_format_ != src_format || dst_format_ != dst_format) {
        if(ctx_) sws_freeContext(ctx_);
        ctx_ = sws_getContext(width, height, src_format, width, height, dst_format,
                              SWS_BILINEAR | SWS_ACCURATE_RND, nullptr, nullptr, nullptr);
        width_ = width; height_ = height; src_format_ = src_format; dst_format_ = dst_format;
    }
    if(!ctx_) {
        std::string msg = "swscale cannot convert " + format_name(src_format) + " to " + format_name(dst_format) +
                          " at " + std::to_string(width) + "x" + std::to_string(height);
        log::error("codec: " + msg);
        return core::make_error(core::ErrorCode::UnsupportedGeometry, std::move(msg));
    }
    const int rows = sws_scale(ctx_, src, src_stride, 0, height, dst, dst_stride);
    if(rows != height) {
        std::string msg = "sws_scale produced " + std::to_string(rows) + " of " + std::to_string(height) + " rows";
        log::error("codec: " + msg);
        return core::make_error(core::ErrorCode::UnsupportedGeometry, std::move(msg));
    }
    return {};
}

const char* swscale_ident() noexcept {
    return LIBSWSCALE_IDENT;
}

} // namespace rdc::codec
