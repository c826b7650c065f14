#pragma once
#include <cstddef>

namespace rdc::pixel {

// Layout names list channels in memory byte order, independent of host
// endianness: ARGB32 is bytes [A,R,G,B]. A native-endian 0xAARRGGBB word on a
// little-endian host is BGRA32, a different layout; the two are never aliases.
enum class PixelLayout { ARGB32, BGRA32, RGBA32, RGB24 };

// Byte offset of each channel within one pixel; alpha is -1 for RGB24.
struct ChannelOffsets {
    int r;
    int g;
    int b;
    int a;
};

constexpr size_t bytes_per_pixel(PixelLayout layout) noexcept {
    return layout == PixelLayout::RGB24 ? 3 : 4;
}

constexpr bool has_alpha(PixelLayout layout) noexcept {
    return layout != PixelLayout::RGB24;
}

constexpr ChannelOffsets channel_offsets(PixelLayout layout) noexcept {
    switch(layout) {
        case PixelLayout::ARGB32: return {1, 2, 3, 0};
        case PixelLayout::BGRA32: return {2, 1, 0, 3};
        case PixelLayout::RGBA32: return {0, 1, 2, 3};
        case PixelLayout::RGB24:  return {0, 1, 2, -1};
    }
    return {0, 1, 2, -1};
}

const char* layout_name(PixelLayout layout) noexcept;

} // namespace rdc::pixel
