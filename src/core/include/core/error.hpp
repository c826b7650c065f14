#pragma once
#include "core/expected.hpp"
#include <string>

namespace rdc::core {

enum class ErrorCode {
    None,
    InvalidBufferSize,   // length not a multiple of pixel size, or shorter than required
    UnsupportedGeometry, // backing library refused width/height
    SizeMismatch,        // input geometry disagrees with the context's bound geometry
    DecodeError,         // malformed/undecodable stream; context stays usable
    EncodeError,         // library failed to encode one frame; context stays usable
    InvalidState,        // lifecycle violation or stale output handle
    UnsupportedBackend,  // backend lacks the requested direction or codec
    UnsupportedLayout,   // layout has no alpha, or codec input is not RGB24
    BufferAliased        // region conflicts with an active write lease
};

struct Error {
    ErrorCode code = ErrorCode::None;
    std::string message;
};

const char* to_string(ErrorCode code) noexcept;

// Builds an unexpected<Error>. Does not log; callers log at the failure site.
inline unexpected<Error> make_error(ErrorCode code, std::string message) {
    return unexpected<Error>(Error{code, std::move(message)});
}

// "InvalidBufferSize: length 7 is not a multiple of 4"
std::string describe(const Error& err);

} // namespace rdc::core

namespace rdc {

template <class T>
using Result = expected<T, core::Error>;

using Status = expected<void, core::Error>;

} // namespace rdc
