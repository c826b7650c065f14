#include "codec/backend.hpp"
#include "codec/codec_types.hpp"

namespace rdc::codec {

const char* to_string(Direction dir) noexcept {
    return dir == Direction::Encode ? "encoder" : "decoder";
}

const char* to_string(BackendKind kind) noexcept {
    switch(kind) {
        case BackendKind::Vpx: return "vpx";
        case BackendKind::Avcodec: return "avcodec";
    }
    return "unknown";
}

const char* to_string(ContextState state) noexcept {
    switch(state) {
        case ContextState::Uninitialized: return "Uninitialized";
        case ContextState::Ready: return "Ready";
        case ContextState::Destroyed: return "Destroyed";
    }
    return "unknown";
}

std::unique_ptr<ICodecBackend> create_backend(BackendKind kind, const config::Settings& settings) {
    switch(kind) {
        case BackendKind::Vpx: return create_vpx_backend(settings);
        case BackendKind::Avcodec: return create_avcodec_backend(settings);
    }
    return nullptr;
}

} // namespace rdc::codec
