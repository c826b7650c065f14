#pragma once
#include "core/byte_view.hpp"
#include "core/error.hpp"
#include "pixel/frame.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace rdc::binding {

// The only place raw (address, length) pairs from the host become views.
// Everything downstream receives already validated views.

// Fails with InvalidBufferSize when addr is null with a non-zero length, or
// when length < required.
Result<ConstByteView> bind_read(const void* addr, size_t length, size_t required = 0);
Result<MutableByteView> bind_write(void* addr, size_t length, size_t required = 0);

// Validates width/height > 0, stride >= width * bpp(layout) and
// length >= stride * height.
Result<pixel::FrameView> bind_frame(const void* addr, size_t length,
                                    int32_t width, int32_t height, int32_t stride,
                                    pixel::PixelLayout layout);

inline ConstByteView view_of(const std::vector<uint8_t>& v) noexcept { return ConstByteView(v.data(), v.size()); }
inline MutableByteView view_of(std::vector<uint8_t>& v) noexcept { return MutableByteView(v.data(), v.size()); }

} // namespace rdc::binding
