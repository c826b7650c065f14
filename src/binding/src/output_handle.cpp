#include "binding/output_handle.hpp"
#include "core/log.hpp"

namespace rdc::binding {

using core::ErrorCode;
using core::make_error;

OutputHandle OutputSlot::publish(const uint8_t* data, size_t size, const OutputInfo& info) {
    invalidate();
    std::weak_ptr<const uint64_t> weak = generation_;
    return OutputHandle(std::move(weak), *generation_, data, size, info);
}

bool OutputHandle::valid() const noexcept {
    auto gen = generation_.lock();
    return gen && *gen == issued_at_;
}

Result<ConstByteView> OutputHandle::view() const {
    if(!valid()) {
        log::warn("binding: output handle used after its context produced newer output or was destroyed");
        return make_error(ErrorCode::InvalidState, "output handle is stale");
    }
    return ConstByteView(data_, size_);
}

Result<std::vector<uint8_t>> OutputHandle::copy_out() const {
    auto v = view();
    if(!v) return make_unexpected(std::move(v).error());
    return std::vector<uint8_t>(v->begin(), v->end());
}

Result<pixel::PixelFrame> OutputHandle::copy_frame() const {
    if(!info_.pixels) {
        return make_error(ErrorCode::InvalidState, "output handle does not reference pixel data");
    }
    auto bytes = copy_out();
    if(!bytes) return make_unexpected(std::move(bytes).error());
    pixel::PixelFrame frame;
    frame.width = info_.width;
    frame.height = info_.height;
    frame.stride = info_.stride;
    frame.layout = info_.layout;
    frame.data = std::move(*bytes);
    return frame;
}

} // namespace rdc::binding
