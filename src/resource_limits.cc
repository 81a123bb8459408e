#include "enginebox/resource_limits.hh"

#include <limits>

namespace {

constexpr uint64_t mib = 1 << 20;

constexpr uint64_t mb_to_bytes(uint64_t mb) noexcept {
    if (mb > std::numeric_limits<uint64_t>::max() / mib) {
        return std::numeric_limits<uint64_t>::max();
    }
    return mb * mib;
}

} // namespace

namespace enginebox {

uint64_t ResourceLimits::heap_size_in_bytes() const noexcept {
    auto old_gen = mb_to_bytes(max_old_generation_size_mb);
    auto young_gen = mb_to_bytes(max_young_generation_size_mb);
    if (old_gen == 0 or young_gen == 0) {
        return 0; // one of the generations is unbounded
    }
    if (old_gen > std::numeric_limits<uint64_t>::max() - young_gen) {
        return std::numeric_limits<uint64_t>::max();
    }
    return old_gen + young_gen;
}

uint64_t ResourceLimits::stack_size_in_bytes() const noexcept {
    return mb_to_bytes(stack_size_mb);
}

ResourceLimits resource_limits_for(uint64_t memory_limit_in_bytes) noexcept {
    auto ceiling = memory_ceiling_mb(memory_limit_in_bytes);
    return {
        .max_old_generation_size_mb = ceiling,
        .max_young_generation_size_mb = ceiling,
        .stack_size_mb = ceiling,
    };
}

} // namespace enginebox
