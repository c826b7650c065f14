#pragma once
#include "binding/output_handle.hpp"
#include "codec/backend.hpp"
#include "codec/codec_types.hpp"
#include "core/byte_view.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "pixel/frame.hpp"
#include <memory>

namespace rdc::codec {

// One encoder or decoder session bound to a single (width, height) and one
// backing library.
//
// Lifecycle: Uninitialized --init--> Ready --cleanup--> Destroyed.
//  * init() only from Uninitialized; a refused geometry leaves it there.
//  * process() only in Ready. DecodeError/EncodeError are per call; the
//    context remains Ready.
//  * cleanup() only in Ready; a second cleanup fails with InvalidState.
//  * The destructor releases a context that is still Ready.
//
// Every process() call retires the OutputHandle returned by the previous one.
// Calls on one context must be serialized by the caller; separate contexts
// share nothing.
class CodecContext {
public:
    explicit CodecContext(BackendKind kind, const config::Settings& settings = config::current());
    explicit CodecContext(std::unique_ptr<ICodecBackend> backend);
    ~CodecContext();

    CodecContext(const CodecContext&) = delete;
    CodecContext& operator=(const CodecContext&) = delete;

    Status init(int32_t width, int32_t height, Direction direction);

    // Encode. `frame` must be RGB24 with exactly the bound width/height and a
    // stride of at least width * 3.
    Result<binding::OutputHandle> process(const pixel::FrameView& frame);

    // Decode. Returns RGB24 pixels; handle info carries width/height/stride.
    Result<binding::OutputHandle> process(ConstByteView coded);

    Status cleanup();

    ContextState state() const noexcept { return state_; }
    Direction direction() const noexcept { return direction_; }
    const Geometry& geometry() const noexcept { return geometry_; }
    const ContextStats& stats() const noexcept { return stats_; }
    const char* backend_name() const noexcept;

private:
    Status require_ready(Direction wanted, const char* op) const;
    void record_failure(const core::Error& err);

    std::unique_ptr<ICodecBackend> backend_;
    ContextState state_ = ContextState::Uninitialized;
    Direction direction_ = Direction::Encode;
    Geometry geometry_;
    ContextStats stats_;
    binding::OutputSlot output_;
};

// Creates and initializes a context in one step.
Result<std::unique_ptr<CodecContext>> open_context(BackendKind kind, Direction direction,
                                                   int32_t width, int32_t height,
                                                   const config::Settings& settings = config::current());

} // namespace rdc::codec
