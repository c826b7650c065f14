#pragma once
#include <cstdint>

namespace rdc::codec {

enum class Direction { Encode, Decode };

enum class BackendKind { Vpx, Avcodec };

// Uninitialized -> Ready (init) -> Destroyed (cleanup). No way back.
enum class ContextState { Uninitialized, Ready, Destroyed };

struct Geometry {
    int32_t width = 0;
    int32_t height = 0;
};

struct ContextStats {
    int64_t frames_processed = 0;
    int64_t bytes_in = 0;
    int64_t bytes_out = 0;
    int64_t failed_calls = 0;
};

const char* to_string(Direction dir) noexcept;
const char* to_string(BackendKind kind) noexcept;
const char* to_string(ContextState state) noexcept;

} // namespace rdc::codec
