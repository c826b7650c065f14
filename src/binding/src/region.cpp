#include "binding/region.hpp"
#include "core/log.hpp"
#include <string>

namespace rdc::binding {

using core::ErrorCode;
using core::make_error;

namespace {

Status check_region(const void* addr, size_t length, size_t required, const char* what) {
    if(addr == nullptr && length > 0) {
        std::string msg = std::string(what) + ": null address with length " + std::to_string(length);
        log::warn("binding: " + msg);
        return make_error(ErrorCode::InvalidBufferSize, std::move(msg));
    }
    if(length < required) {
        std::string msg = std::string(what) + ": region holds " + std::to_string(length) +
                          " bytes, operation needs " + std::to_string(required);
        log::warn("binding: " + msg);
        return make_error(ErrorCode::InvalidBufferSize, std::move(msg));
    }
    return {};
}

} // namespace

Result<ConstByteView> bind_read(const void* addr, size_t length, size_t required) {
    if(auto ok = check_region(addr, length, required, "bind_read"); !ok) return make_unexpected(std::move(ok).error());
    return ConstByteView(static_cast<const uint8_t*>(addr), length);
}

Result<MutableByteView> bind_write(void* addr, size_t length, size_t required) {
    if(auto ok = check_region(addr, length, required, "bind_write"); !ok) return make_unexpected(std::move(ok).error());
    return MutableByteView(static_cast<uint8_t*>(addr), length);
}

Result<pixel::FrameView> bind_frame(const void* addr, size_t length,
                                    int32_t width, int32_t height, int32_t stride,
                                    pixel::PixelLayout layout) {
    if(width <= 0 || height <= 0) {
        std::string msg = "bind_frame: invalid frame size " + std::to_string(width) + "x" + std::to_string(height);
        log::warn("binding: " + msg);
        return make_error(ErrorCode::InvalidBufferSize, std::move(msg));
    }
    const size_t row = static_cast<size_t>(width) * pixel::bytes_per_pixel(layout);
    if(stride < 0 || static_cast<size_t>(stride) < row) {
        std::string msg = "bind_frame: stride " + std::to_string(stride) + " is shorter than a " +
                          std::to_string(width) + " pixel " + pixel::layout_name(layout) + " row";
        log::warn("binding: " + msg);
        return make_error(ErrorCode::InvalidBufferSize, std::move(msg));
    }
    const size_t required = static_cast<size_t>(stride) * static_cast<size_t>(height);
    auto bytes = bind_read(addr, length, required);
    if(!bytes) return make_unexpected(std::move(bytes).error());
    return pixel::FrameView{*bytes, width, height, stride, layout};
}

} // namespace rdc::binding
