#include "codec/codec_context.hpp"
#include "core/log.hpp"
#include <string>

namespace rdc::codec {

using core::ErrorCode;
using core::make_error;

namespace {

std::string size_str(int32_t w, int32_t h) {
    return std::to_string(w) + "x" + std::to_string(h);
}

} // namespace

CodecContext::CodecContext(BackendKind kind, const config::Settings& settings)
    : backend_(create_backend(kind, settings)) {}

CodecContext::CodecContext(std::unique_ptr<ICodecBackend> backend)
    : backend_(std::move(backend)) {}

CodecContext::~CodecContext() {
    if(state_ == ContextState::Ready) {
        log::debug(std::string("codec: releasing ") + backend_name() + " " + to_string(direction_) + " " +
                   size_str(geometry_.width, geometry_.height) + " from destructor");
        output_.invalidate();
        backend_->close();
        state_ = ContextState::Destroyed;
    }
}

const char* CodecContext::backend_name() const noexcept {
    return backend_ ? backend_->name() : "none";
}

Status CodecContext::init(int32_t width, int32_t height, Direction direction) {
    if(state_ != ContextState::Uninitialized) {
        std::string msg = std::string("init called on a ") + to_string(state_) + " context";
        log::error("codec: " + msg);
        return make_error(ErrorCode::InvalidState, std::move(msg));
    }
    if(!backend_) {
        log::error("codec: init without a backend");
        return make_error(ErrorCode::UnsupportedBackend, "no backend available");
    }
    if(!backend_->supports(direction)) {
        std::string msg = std::string(backend_->name()) + " has no " + to_string(direction);
        log::warn("codec: " + msg);
        return make_error(ErrorCode::UnsupportedBackend, std::move(msg));
    }
    if(width <= 0 || height <= 0) {
        std::string msg = "invalid frame size " + size_str(width, height);
        log::warn("codec: " + msg);
        return make_error(ErrorCode::UnsupportedGeometry, std::move(msg));
    }

    const Geometry geometry{width, height};
    if(auto ok = backend_->open(direction, geometry); !ok) return ok;

    geometry_ = geometry;
    direction_ = direction;
    state_ = ContextState::Ready;
    log::debug(std::string("codec: ") + backend_->name() + " " + to_string(direction) + " ready for " +
               size_str(width, height));
    return {};
}

Status CodecContext::require_ready(Direction wanted, const char* op) const {
    if(state_ != ContextState::Ready) {
        std::string msg = std::string(op) + " called on a " + to_string(state_) + " context";
        log::error("codec: " + msg);
        return make_error(ErrorCode::InvalidState, std::move(msg));
    }
    if(direction_ != wanted) {
        std::string msg = std::string(op) + ": context is a " + to_string(direction_) + ", not a " + to_string(wanted);
        log::error("codec: " + msg);
        return make_error(ErrorCode::InvalidState, std::move(msg));
    }
    return {};
}

void CodecContext::record_failure(const core::Error& err) {
    ++stats_.failed_calls;
    log::debug(std::string("codec: ") + backend_name() + " call failed: " + core::describe(err));
}

Result<binding::OutputHandle> CodecContext::process(const pixel::FrameView& frame) {
    if(auto ok = require_ready(Direction::Encode, "process(frame)"); !ok) return make_unexpected(std::move(ok).error());
    // The backend reuses its output buffer, so the previous handle dies here.
    output_.invalidate();

    auto fail = [this](ErrorCode code, std::string msg) -> Result<binding::OutputHandle> {
        log::warn("codec: " + msg);
        core::Error err{code, std::move(msg)};
        record_failure(err);
        return make_unexpected(std::move(err));
    };

    if(frame.layout != pixel::PixelLayout::RGB24) {
        return fail(ErrorCode::UnsupportedLayout,
                    std::string("encoder input must be RGB24, got ") + pixel::layout_name(frame.layout));
    }
    if(frame.width != geometry_.width || frame.height != geometry_.height) {
        return fail(ErrorCode::SizeMismatch, "frame " + size_str(frame.width, frame.height) +
                                             " does not match context " + size_str(geometry_.width, geometry_.height));
    }
    const int32_t min_stride = geometry_.width * 3;
    if(frame.stride < min_stride) {
        return fail(ErrorCode::SizeMismatch, "stride " + std::to_string(frame.stride) + " implies width " +
                                             std::to_string(frame.stride / 3) + ", context width is " +
                                             std::to_string(geometry_.width));
    }
    const size_t need = static_cast<size_t>(frame.stride) * static_cast<size_t>(geometry_.height);
    if(frame.bytes.size() < need) {
        return fail(ErrorCode::InvalidBufferSize, "frame holds " + std::to_string(frame.bytes.size()) +
                                                  " bytes, stride*height needs " + std::to_string(need));
    }

    auto region = backend_->compress(frame.bytes.subview(0, need), frame.stride);
    if(!region) {
        record_failure(region.error());
        return make_unexpected(std::move(region).error());
    }

    ++stats_.frames_processed;
    stats_.bytes_in += static_cast<int64_t>(need);
    stats_.bytes_out += static_cast<int64_t>(region->size);
    binding::OutputInfo info;
    info.keyframe = region->keyframe;
    return output_.publish(region->data, region->size, info);
}

Result<binding::OutputHandle> CodecContext::process(ConstByteView coded) {
    if(auto ok = require_ready(Direction::Decode, "process(coded)"); !ok) return make_unexpected(std::move(ok).error());
    output_.invalidate();

    if(coded.empty()) {
        core::Error err{ErrorCode::InvalidBufferSize, "empty compressed input"};
        log::warn("codec: " + err.message);
        record_failure(err);
        return make_unexpected(std::move(err));
    }

    auto region = backend_->decompress(coded);
    if(!region) {
        record_failure(region.error());
        return make_unexpected(std::move(region).error());
    }
    if(region->width != geometry_.width || region->height != geometry_.height) {
        core::Error err{ErrorCode::SizeMismatch, "stream decoded to " + size_str(region->width, region->height) +
                                                 ", context is " + size_str(geometry_.width, geometry_.height)};
        log::warn("codec: " + err.message);
        record_failure(err);
        return make_unexpected(std::move(err));
    }

    ++stats_.frames_processed;
    stats_.bytes_in += static_cast<int64_t>(coded.size());
    stats_.bytes_out += static_cast<int64_t>(region->size);
    binding::OutputInfo info;
    info.width = region->width;
    info.height = region->height;
    info.stride = region->stride;
    info.pixels = true;
    info.layout = pixel::PixelLayout::RGB24;
    return output_.publish(region->data, region->size, info);
}

Status CodecContext::cleanup() {
    if(state_ != ContextState::Ready) {
        std::string msg = std::string("cleanup called on a ") + to_string(state_) + " context";
        log::error("codec: " + msg);
        return make_error(ErrorCode::InvalidState, std::move(msg));
    }
    output_.invalidate();
    backend_->close();
    state_ = ContextState::Destroyed;
    log::debug(std::string("codec: ") + backend_->name() + " " + to_string(direction_) + " " +
               size_str(geometry_.width, geometry_.height) + " destroyed after " +
               std::to_string(stats_.frames_processed) + " frames");
    return {};
}

Result<std::unique_ptr<CodecContext>> open_context(BackendKind kind, Direction direction,
                                                   int32_t width, int32_t height,
                                                   const config::Settings& settings) {
    auto ctx = std::make_unique<CodecContext>(kind, settings);
    if(auto ok = ctx->init(width, height, direction); !ok) return make_unexpected(std::move(ok).error());
    return ctx;
}

} // namespace rdc::codec
