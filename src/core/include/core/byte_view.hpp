#pragma once
#include <cstddef>
#include <cstdint>

namespace rdc {

// Non-owning views over caller memory. Length is carried explicitly and never
// re-derived from the allocation. Built by rdc::binding after validation and
// passed by value from there on.
class ConstByteView {
public:
    ConstByteView() = default;
    ConstByteView(const uint8_t* data, size_t size) noexcept : data_(data), size_(size) {}

    const uint8_t* data() const noexcept { return data_; }
    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }
    const uint8_t* begin() const noexcept { return data_; }
    const uint8_t* end() const noexcept { return data_ + size_; }
    uint8_t operator[](size_t i) const noexcept { return data_[i]; }

    // Clamped to the view; never extends past size().
    ConstByteView subview(size_t offset, size_t count) const noexcept {
        if(offset > size_) offset = size_;
        if(count > size_ - offset) count = size_ - offset;
        return ConstByteView(data_ + offset, count);
    }

private:
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
};

class MutableByteView {
public:
    MutableByteView() = default;
    MutableByteView(uint8_t* data, size_t size) noexcept : data_(data), size_(size) {}

    uint8_t* data() const noexcept { return data_; }
    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }
    uint8_t* begin() const noexcept { return data_; }
    uint8_t* end() const noexcept { return data_ + size_; }
    uint8_t& operator[](size_t i) const noexcept { return data_[i]; }

    MutableByteView subview(size_t offset, size_t count) const noexcept {
        if(offset > size_) offset = size_;
        if(count > size_ - offset) count = size_ - offset;
        return MutableByteView(data_ + offset, count);
    }

    operator ConstByteView() const noexcept { return ConstByteView(data_, size_); }

private:
    uint8_t* data_ = nullptr;
    size_t size_ = 0;
};

} // namespace rdc
