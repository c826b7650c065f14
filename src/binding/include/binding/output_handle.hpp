#pragma once
#include "core/byte_view.hpp"
#include "core/error.hpp"
#include "pixel/frame.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace rdc::binding {

// Describes what an output region holds. Compressed output leaves the
// geometry fields at zero.
struct OutputInfo {
    int32_t width = 0;
    int32_t height = 0;
    int32_t stride = 0;
    bool pixels = false;
    bool keyframe = false; // compressed output only
    pixel::PixelLayout layout = pixel::PixelLayout::RGB24;
};

// (pointer, length) into memory owned by a codec context. Valid only until the
// next process call, cleanup, or destruction of the issuing context; after
// that every accessor fails with InvalidState instead of reading freed or
// overwritten memory. Copy out before the next call to keep the data.
class OutputHandle {
public:
    OutputHandle() = default;

    bool valid() const noexcept;
    size_t size() const noexcept { return size_; }
    const OutputInfo& info() const noexcept { return info_; }

    Result<ConstByteView> view() const;
    Result<std::vector<uint8_t>> copy_out() const;
    // Only for pixel output; yields a tightly described owning frame.
    Result<pixel::PixelFrame> copy_frame() const;

private:
    friend class OutputSlot;
    OutputHandle(std::weak_ptr<const uint64_t> generation, uint64_t issued_at,
                 const uint8_t* data, size_t size, const OutputInfo& info) noexcept
        : generation_(std::move(generation)), issued_at_(issued_at), data_(data), size_(size), info_(info) {}

    std::weak_ptr<const uint64_t> generation_;
    uint64_t issued_at_ = 0;
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    OutputInfo info_;
};

// Owned by each codec context. publish() hands out a handle for the region the
// backing library just produced; invalidate() retires every earlier handle.
class OutputSlot {
public:
    OutputSlot() : generation_(std::make_shared<uint64_t>(1)) {}

    OutputSlot(const OutputSlot&) = delete;
    OutputSlot& operator=(const OutputSlot&) = delete;

    OutputHandle publish(const uint8_t* data, size_t size, const OutputInfo& info = {});
    void invalidate() noexcept { ++*generation_; }
    uint64_t generation() const noexcept { return *generation_; }

private:
    std::shared_ptr<uint64_t> generation_;
};

} // namespace rdc::binding
