#include "binding/lease.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <string>
#include <vector>

namespace rdc::binding {

namespace {

struct Entry {
    uint64_t id;
    uintptr_t begin;
    uintptr_t end;
    Access access;
};

struct LeaseTable {
    std::vector<Entry> entries;
    uint64_t next_id = 1;
};

LeaseTable& table() {
    static thread_local LeaseTable t;
    return t;
}

} // namespace

Result<RegionLease> acquire(const uint8_t* begin, size_t size, Access access) {
    auto& t = table();
    const uintptr_t b = reinterpret_cast<uintptr_t>(begin);
    const uintptr_t e = b + size;
    // Empty regions cannot alias anything.
    if(size > 0) {
        for(const auto& entry : t.entries) {
            const bool overlap = b < entry.end && entry.begin < e;
            if(!overlap) continue;
            if(access == Access::Write || entry.access == Access::Write) {
                std::string msg = std::string(access == Access::Write ? "write" : "read") +
                                  " lease of " + std::to_string(size) + " bytes overlaps an active " +
                                  (entry.access == Access::Write ? "write" : "read") + " lease";
                log::warn("binding: " + msg);
                return core::make_error(core::ErrorCode::BufferAliased, std::move(msg));
            }
        }
    }
    const uint64_t id = t.next_id++;
    t.entries.push_back(Entry{id, b, e, access});
    return RegionLease(id, access);
}

size_t active_lease_count() noexcept {
    return table().entries.size();
}

RegionLease::~RegionLease() { release(); }

RegionLease::RegionLease(RegionLease&& other) noexcept : id_(other.id_), access_(other.access_) {
    other.id_ = 0;
}

RegionLease& RegionLease::operator=(RegionLease&& other) noexcept {
    if(this != &other) {
        release();
        id_ = other.id_;
        access_ = other.access_;
        other.id_ = 0;
    }
    return *this;
}

void RegionLease::release() noexcept {
    if(id_ == 0) return;
    auto& entries = table().entries;
    auto it = std::find_if(entries.begin(), entries.end(), [this](const Entry& e) { return e.id == id_; });
    if(it != entries.end()) entries.erase(it);
    id_ = 0;
}

} // namespace rdc::binding
