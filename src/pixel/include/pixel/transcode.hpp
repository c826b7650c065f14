#pragma once
#include "core/byte_view.hpp"
#include "core/error.hpp"
#include "pixel/frame.hpp"
#include "pixel/layout.hpp"
#include <cstdint>
#include <vector>

namespace rdc::pixel {

// All operations below validate lengths before touching memory and fail with
// InvalidBufferSize rather than truncating. They keep no state between calls.

// Exact output length of converting a valid run of `src_len` bytes.
size_t output_size(size_t src_len, PixelLayout from, PixelLayout to) noexcept;

// Checks that `len` holds a whole number of `layout` pixels.
Status validate_run(size_t len, PixelLayout layout);

// Channel remap into a new allocation. ARGB32 -> RGBA32 emits [R,G,B,A] per
// source [A,R,G,B]; ARGB32 -> RGB24 drops alpha (output is 3/4 of input).
// Layouts gaining an alpha channel get 0xFF.
Result<std::vector<uint8_t>> convert(ConstByteView src, PixelLayout from, PixelLayout to);

// Same as convert() without allocating. `dst` must hold output_size() bytes
// and must not overlap `src` (BufferAliased otherwise).
Status convert_into(ConstByteView src, PixelLayout from, MutableByteView dst, PixelLayout to);

// Row-wise conversion honoring source stride padding; the result is tightly
// packed (stride = width * bytes_per_pixel(to)).
Result<PixelFrame> convert_frame(const FrameView& src, PixelLayout to);

// c' = floor(c * a / 255) for r, g, b; alpha unchanged.
Status premultiply_in_place(MutableByteView buf, PixelLayout layout = PixelLayout::ARGB32);

// c' = min(255, floor(c * 255 / a)); a == 0 zeroes all four bytes.
// Lossy against premultiply for 0 < a < 255, e.g. 200 -> 100 -> 199 at a=128.
Status unpremultiply_in_place(MutableByteView buf, PixelLayout layout = PixelLayout::ARGB32);

} // namespace rdc::pixel
