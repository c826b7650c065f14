#include "pixel/transcode.hpp"
#include "core/log.hpp"
#include <cstring>
#include <string>

namespace rdc::pixel {

using core::ErrorCode;
using core::make_error;

namespace {

using RemapFn = void (*)(const uint8_t*, uint8_t*, size_t) noexcept;

template <PixelLayout From, PixelLayout To>
void remap_pixels(const uint8_t* src, uint8_t* dst, size_t count) noexcept {
    constexpr ChannelOffsets s = channel_offsets(From);
    constexpr ChannelOffsets d = channel_offsets(To);
    constexpr size_t sbpp = bytes_per_pixel(From);
    constexpr size_t dbpp = bytes_per_pixel(To);
    for(size_t i = 0; i < count; ++i, src += sbpp, dst += dbpp) {
        dst[d.r] = src[s.r];
        dst[d.g] = src[s.g];
        dst[d.b] = src[s.b];
        if constexpr (d.a >= 0) {
            if constexpr (s.a >= 0) dst[d.a] = src[s.a];
            else dst[d.a] = 0xFF;
        }
    }
}

template <PixelLayout From>
RemapFn remap_to(PixelLayout to) noexcept {
    switch(to) {
        case PixelLayout::ARGB32: return &remap_pixels<From, PixelLayout::ARGB32>;
        case PixelLayout::BGRA32: return &remap_pixels<From, PixelLayout::BGRA32>;
        case PixelLayout::RGBA32: return &remap_pixels<From, PixelLayout::RGBA32>;
        case PixelLayout::RGB24:  return &remap_pixels<From, PixelLayout::RGB24>;
    }
    return nullptr;
}

RemapFn select_remap(PixelLayout from, PixelLayout to) noexcept {
    switch(from) {
        case PixelLayout::ARGB32: return remap_to<PixelLayout::ARGB32>(to);
        case PixelLayout::BGRA32: return remap_to<PixelLayout::BGRA32>(to);
        case PixelLayout::RGBA32: return remap_to<PixelLayout::RGBA32>(to);
        case PixelLayout::RGB24:  return remap_to<PixelLayout::RGB24>(to);
    }
    return nullptr;
}

bool overlaps(const uint8_t* a, size_t a_len, const uint8_t* b, size_t b_len) noexcept {
    if(a_len == 0 || b_len == 0) return false;
    auto a0 = reinterpret_cast<uintptr_t>(a), b0 = reinterpret_cast<uintptr_t>(b);
    return a0 < b0 + b_len && b0 < a0 + a_len;
}

Status validate_alpha_run(size_t len, PixelLayout layout, const char* op) {
    if(!has_alpha(layout)) {
        std::string msg = std::string(op) + ": layout " + layout_name(layout) + " has no alpha channel";
        log::warn(msg);
        return make_error(ErrorCode::UnsupportedLayout, std::move(msg));
    }
    return validate_run(len, layout);
}

} // namespace

const char* layout_name(PixelLayout layout) noexcept {
    switch(layout) {
        case PixelLayout::ARGB32: return "ARGB32";
        case PixelLayout::BGRA32: return "BGRA32";
        case PixelLayout::RGBA32: return "RGBA32";
        case PixelLayout::RGB24:  return "RGB24";
    }
    return "unknown";
}

size_t output_size(size_t src_len, PixelLayout from, PixelLayout to) noexcept {
    return src_len / bytes_per_pixel(from) * bytes_per_pixel(to);
}

Status validate_run(size_t len, PixelLayout layout) {
    const size_t bpp = bytes_per_pixel(layout);
    if(len % bpp != 0) {
        std::string msg = "length " + std::to_string(len) + " is not a multiple of " +
                          std::to_string(bpp) + " (" + layout_name(layout) + ")";
        log::warn("pixel: " + msg);
        return make_error(ErrorCode::InvalidBufferSize, std::move(msg));
    }
    return {};
}

Status convert_into(ConstByteView src, PixelLayout from, MutableByteView dst, PixelLayout to) {
    if(auto ok = validate_run(src.size(), from); !ok) return ok;
    const size_t need = output_size(src.size(), from, to);
    if(dst.size() < need) {
        std::string msg = "destination holds " + std::to_string(dst.size()) + " bytes, need " + std::to_string(need);
        log::warn("pixel: convert_into " + msg);
        return make_error(ErrorCode::InvalidBufferSize, std::move(msg));
    }
    if(overlaps(src.data(), src.size(), dst.data(), need)) {
        log::warn("pixel: convert_into source and destination overlap");
        return make_error(ErrorCode::BufferAliased, "source and destination overlap");
    }
    if(src.empty()) return {};
    if(from == to) {
        std::memcpy(dst.data(), src.data(), src.size());
        return {};
    }
    RemapFn fn = select_remap(from, to);
    fn(src.data(), dst.data(), src.size() / bytes_per_pixel(from));
    return {};
}

Result<std::vector<uint8_t>> convert(ConstByteView src, PixelLayout from, PixelLayout to) {
    if(auto ok = validate_run(src.size(), from); !ok) return make_unexpected(std::move(ok).error());
    std::vector<uint8_t> out(output_size(src.size(), from, to));
    if(auto ok = convert_into(src, from, MutableByteView(out.data(), out.size()), to); !ok) {
        return make_unexpected(std::move(ok).error());
    }
    return out;
}

Result<PixelFrame> convert_frame(const FrameView& src, PixelLayout to) {
    const size_t sbpp = bytes_per_pixel(src.layout);
    if(src.width <= 0 || src.height <= 0) {
        std::string msg = "invalid frame size " + std::to_string(src.width) + "x" + std::to_string(src.height);
        log::warn("pixel: convert_frame " + msg);
        return make_error(ErrorCode::InvalidBufferSize, std::move(msg));
    }
    const size_t row_in = static_cast<size_t>(src.width) * sbpp;
    if(src.stride < 0 || static_cast<size_t>(src.stride) < row_in ||
       src.bytes.size() < static_cast<size_t>(src.stride) * static_cast<size_t>(src.height)) {
        std::string msg = "frame " + std::to_string(src.width) + "x" + std::to_string(src.height) +
                          " stride " + std::to_string(src.stride) + " does not fit " +
                          std::to_string(src.bytes.size()) + " bytes";
        log::warn("pixel: convert_frame " + msg);
        return make_error(ErrorCode::InvalidBufferSize, std::move(msg));
    }

    PixelFrame out;
    out.width = src.width;
    out.height = src.height;
    out.layout = to;
    const size_t row_out = static_cast<size_t>(src.width) * bytes_per_pixel(to);
    out.stride = static_cast<int32_t>(row_out);
    out.data.resize(row_out * static_cast<size_t>(src.height));

    for(int32_t y = 0; y < src.height; ++y) {
        ConstByteView row = src.bytes.subview(static_cast<size_t>(y) * static_cast<size_t>(src.stride), row_in);
        MutableByteView dst(out.data.data() + static_cast<size_t>(y) * row_out, row_out);
        if(auto ok = convert_into(row, src.layout, dst, to); !ok) return make_unexpected(std::move(ok).error());
    }
    return out;
}

Status premultiply_in_place(MutableByteView buf, PixelLayout layout) {
    if(auto ok = validate_alpha_run(buf.size(), layout, "premultiply"); !ok) return ok;
    const ChannelOffsets o = channel_offsets(layout);
    uint8_t* p = buf.data();
    const uint8_t* end = p + buf.size();
    for(; p != end; p += 4) {
        const unsigned a = p[o.a];
        if(a == 255) continue;
        p[o.r] = static_cast<uint8_t>(p[o.r] * a / 255);
        p[o.g] = static_cast<uint8_t>(p[o.g] * a / 255);
        p[o.b] = static_cast<uint8_t>(p[o.b] * a / 255);
    }
    return {};
}

Status unpremultiply_in_place(MutableByteView buf, PixelLayout layout) {
    if(auto ok = validate_alpha_run(buf.size(), layout, "unpremultiply"); !ok) return ok;
    const ChannelOffsets o = channel_offsets(layout);
    auto scale = [](unsigned c, unsigned a) -> uint8_t {
        const unsigned v = c * 255 / a;
        return static_cast<uint8_t>(v > 255 ? 255 : v);
    };
    uint8_t* p = buf.data();
    const uint8_t* end = p + buf.size();
    for(; p != end; p += 4) {
        const unsigned a = p[o.a];
        if(a == 0) {
            p[0] = p[1] = p[2] = p[3] = 0;
            continue;
        }
        if(a == 255) continue;
        p[o.r] = scale(p[o.r], a);
        p[o.g] = scale(p[o.g], a);
        p[o.b] = scale(p[o.b], a);
    }
    return {};
}

} // namespace rdc::pixel
