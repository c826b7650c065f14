#include "core/error.hpp"

namespace rdc::core {

const char* to_string(ErrorCode code) noexcept {
    switch(code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidBufferSize: return "InvalidBufferSize";
        case ErrorCode::UnsupportedGeometry: return "UnsupportedGeometry";
        case ErrorCode::SizeMismatch: return "SizeMismatch";
        case ErrorCode::DecodeError: return "DecodeError";
        case ErrorCode::EncodeError: return "EncodeError";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::UnsupportedBackend: return "UnsupportedBackend";
        case ErrorCode::UnsupportedLayout: return "UnsupportedLayout";
        case ErrorCode::BufferAliased: return "BufferAliased";
    }
    return "Unknown";
}

std::string describe(const Error& err) {
    std::string out = to_string(err.code);
    if(!err.message.empty()) {
        out += ": ";
        out += err.message;
    }
    return out;
}

} // namespace rdc::core
