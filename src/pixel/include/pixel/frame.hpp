#pragma once
#include "core/byte_view.hpp"
#include "pixel/layout.hpp"
#include <cstdint>
#include <vector>

namespace rdc::pixel {

// Non-owning frame: rows of `stride` bytes, the first width*bpp of each used.
// Build through rdc::binding::bind_frame so the size invariants hold.
struct FrameView {
    ConstByteView bytes;
    int32_t width = 0;
    int32_t height = 0;
    int32_t stride = 0; // bytes per row, >= width * bytes_per_pixel(layout)
    PixelLayout layout = PixelLayout::RGB24;
};

// Owning frame produced by conversions and copy-outs.
struct PixelFrame {
    int32_t width = 0;
    int32_t height = 0;
    int32_t stride = 0;
    PixelLayout layout = PixelLayout::RGB24;
    std::vector<uint8_t> data;

    FrameView view() const noexcept {
        return FrameView{ConstByteView(data.data(), data.size()), width, height, stride, layout};
    }
};

} // namespace rdc::pixel
