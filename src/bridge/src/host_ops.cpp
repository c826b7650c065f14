#include "bridge/host_ops.hpp"
#include "binding/lease.hpp"
#include "binding/region.hpp"
#include "core/log.hpp"
#include "pixel/transcode.hpp"
#include <string>

namespace rdc::bridge {

using pixel::PixelLayout;

namespace {

template <class Fn>
Status with_write_region(void* addr, size_t length, Fn&& fn) {
    auto view = binding::bind_write(addr, length);
    if(!view) return make_unexpected(std::move(view).error());
    auto lease = binding::acquire_write(*view);
    if(!lease) return make_unexpected(std::move(lease).error());
    return fn(*view);
}

} // namespace

Result<std::vector<uint8_t>> convert_pixels(const void* addr, size_t length, PixelLayout from, PixelLayout to) {
    auto view = binding::bind_read(addr, length);
    if(!view) return make_unexpected(std::move(view).error());
    auto lease = binding::acquire_read(*view);
    if(!lease) return make_unexpected(std::move(lease).error());
    return pixel::convert(*view, from, to);
}

Result<std::vector<uint8_t>> argb_to_rgba(const void* addr, size_t length) {
    return convert_pixels(addr, length, PixelLayout::ARGB32, PixelLayout::RGBA32);
}

Result<std::vector<uint8_t>> argb_to_rgb(const void* addr, size_t length) {
    return convert_pixels(addr, length, PixelLayout::ARGB32, PixelLayout::RGB24);
}

Status premultiply_argb(void* addr, size_t length) {
    return with_write_region(addr, length, [](MutableByteView v) {
        return pixel::premultiply_in_place(v, PixelLayout::ARGB32);
    });
}

Status unpremultiply_argb(void* addr, size_t length) {
    return with_write_region(addr, length, [](MutableByteView v) {
        return pixel::unpremultiply_in_place(v, PixelLayout::ARGB32);
    });
}

Result<std::vector<uint8_t>> encode_frame(codec::CodecContext& ctx, const void* addr, size_t length,
                                          int32_t width, int32_t height, int32_t stride) {
    if(width <= 0 || height <= 0 || stride <= 0) {
        std::string msg = "encode_frame: invalid frame " + std::to_string(width) + "x" + std::to_string(height) +
                          " stride " + std::to_string(stride);
        log::warn("bridge: " + msg);
        return core::make_error(core::ErrorCode::InvalidBufferSize, std::move(msg));
    }
    // Only the region is bound here. Geometry and stride are checked against
    // the context's bound size by process(), which reports SizeMismatch.
    const size_t required = static_cast<size_t>(stride) * static_cast<size_t>(height);
    auto bytes = binding::bind_read(addr, length, required);
    if(!bytes) return make_unexpected(std::move(bytes).error());
    auto lease = binding::acquire_read(*bytes);
    if(!lease) return make_unexpected(std::move(lease).error());

    const pixel::FrameView frame{*bytes, width, height, stride, PixelLayout::RGB24};
    auto out = ctx.process(frame);
    if(!out) return make_unexpected(std::move(out).error());
    return out->copy_out();
}

Result<pixel::PixelFrame> decode_frame(codec::CodecContext& ctx, const void* addr, size_t length,
                                       PixelLayout display_layout) {
    auto coded = binding::bind_read(addr, length);
    if(!coded) return make_unexpected(std::move(coded).error());
    auto lease = binding::acquire_read(*coded);
    if(!lease) return make_unexpected(std::move(lease).error());
    auto out = ctx.process(*coded);
    if(!out) return make_unexpected(std::move(out).error());

    auto pixels = out->view();
    if(!pixels) return make_unexpected(std::move(pixels).error());
    const auto& info = out->info();
    pixel::FrameView decoded{*pixels, info.width, info.height, info.stride, info.layout};
    return pixel::convert_frame(decoded, display_layout);
}

} // namespace rdc::bridge
