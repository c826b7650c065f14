#pragma once
#include "core/byte_view.hpp"
#include "core/error.hpp"
#include <cstddef>
#include <cstdint>

namespace rdc::binding {

enum class Access { Read, Write };

// RAII registration of a memory region in the current thread's lease table.
// A write lease is exclusive: no other lease may overlap it while it is held.
// Overlapping read leases coexist. Leases are released on destruction and
// must be destroyed on the thread that acquired them.
class RegionLease {
public:
    RegionLease() = default;
    ~RegionLease();

    RegionLease(const RegionLease&) = delete;
    RegionLease& operator=(const RegionLease&) = delete;
    RegionLease(RegionLease&& other) noexcept;
    RegionLease& operator=(RegionLease&& other) noexcept;

    bool active() const noexcept { return id_ != 0; }
    Access access() const noexcept { return access_; }
    void release() noexcept;

private:
    friend Result<RegionLease> acquire(const uint8_t* begin, size_t size, Access access);
    RegionLease(uint64_t id, Access access) noexcept : id_(id), access_(access) {}

    uint64_t id_ = 0;
    Access access_ = Access::Read;
};

// Fails with BufferAliased when the region overlaps an active write lease
// (or, for writes, any active lease) held by this thread.
Result<RegionLease> acquire(const uint8_t* begin, size_t size, Access access);

inline Result<RegionLease> acquire_read(ConstByteView view) {
    return acquire(view.data(), view.size(), Access::Read);
}

inline Result<RegionLease> acquire_write(MutableByteView view) {
    return acquire(view.data(), view.size(), Access::Write);
}

// Number of leases currently held by the calling thread.
size_t active_lease_count() noexcept;

} // namespace rdc::binding
