#pragma once
#include "codec/codec_types.hpp"
#include "core/byte_view.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include <cstdint>
#include <memory>

namespace rdc::codec {

// Regions below point into memory owned by the backend. They stay valid until
// the next compress/decompress/close call on the same backend.
struct EncodedRegion {
    const uint8_t* data = nullptr;
    size_t size = 0;
    bool keyframe = false;
};

struct DecodedRegion {
    const uint8_t* data = nullptr; // packed RGB24 rows
    size_t size = 0;
    int32_t width = 0;
    int32_t height = 0;
    int32_t stride = 0;
};

// Seam to one external codec library, shaped after its C contract
// (init, process, cleanup). CodecContext owns the lifecycle checks; a backend
// may assume it is driven in order: open once, process many, close once.
class ICodecBackend {
public:
    virtual ~ICodecBackend() = default;

    virtual const char* name() const noexcept = 0;
    virtual bool supports(Direction dir) const noexcept = 0;

    // UnsupportedGeometry when the library refuses the frame size.
    virtual Status open(Direction dir, const Geometry& geometry) = 0;

    // `rgb` holds geometry.height rows of `stride` bytes of RGB24.
    virtual Result<EncodedRegion> compress(ConstByteView rgb, int32_t stride) = 0;

    // DecodeError for malformed input; the backend stays usable.
    virtual Result<DecodedRegion> decompress(ConstByteView coded) = 0;

    virtual void close() noexcept = 0;
};

std::unique_ptr<ICodecBackend> create_backend(BackendKind kind, const config::Settings& settings);

std::unique_ptr<ICodecBackend> create_vpx_backend(const config::Settings& settings);
std::unique_ptr<ICodecBackend> create_avcodec_backend(const config::Settings& settings);

} // namespace rdc::codec
