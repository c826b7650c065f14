#pragma once
#include "codec/codec_context.hpp"
#include "core/error.hpp"
#include "pixel/layout.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace rdc::bridge {

// Entry points for the host: raw (address, length) in, validated through
// rdc::binding, then handed to the transcoder or a codec context.
// In-place operations hold an exclusive write lease on the region for their
// duration; conversions hold a read lease and return a new allocation.

Result<std::vector<uint8_t>> argb_to_rgba(const void* addr, size_t length);
Result<std::vector<uint8_t>> argb_to_rgb(const void* addr, size_t length);
Result<std::vector<uint8_t>> convert_pixels(const void* addr, size_t length,
                                            pixel::PixelLayout from, pixel::PixelLayout to);

Status premultiply_argb(void* addr, size_t length);
Status unpremultiply_argb(void* addr, size_t length);

// Encodes one RGB24 frame of `height` rows of `stride` bytes. A width, height
// or stride that disagrees with the context fails with SizeMismatch. The
// returned bytes are a copy, so the context's output buffer may be reused
// immediately.
Result<std::vector<uint8_t>> encode_frame(codec::CodecContext& ctx, const void* addr, size_t length,
                                          int32_t width, int32_t height, int32_t stride);

// Decodes one compressed frame and converts it to `display_layout`.
Result<pixel::PixelFrame> decode_frame(codec::CodecContext& ctx, const void* addr, size_t length,
                                       pixel::PixelLayout display_layout);

} // namespace rdc::bridge
