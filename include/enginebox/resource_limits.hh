#pragma once

#include <cstdint>

namespace enginebox {

// Bounds applied to every worker. The runtime inside the worker learns them through
// environment variables; the worker process itself is bounded with rlimits.
struct ResourceLimits {
    uint64_t max_old_generation_size_mb = 0; // 0 means no limit
    uint64_t max_young_generation_size_mb = 0; // 0 means no limit
    uint64_t stack_size_mb = 0; // 0 means no limit

    // Limit of the data segment of the worker process (both heap generations)
    [[nodiscard]] uint64_t heap_size_in_bytes() const noexcept;

    [[nodiscard]] uint64_t stack_size_in_bytes() const noexcept;

    friend bool operator==(const ResourceLimits&, const ResourceLimits&) = default;
};

constexpr uint64_t memory_ceiling_mb(uint64_t memory_limit_in_bytes) noexcept {
    return memory_limit_in_bytes / 1024;
}

// The single configured value bounds both heap generations and the stack alike
ResourceLimits resource_limits_for(uint64_t memory_limit_in_bytes) noexcept;

} // namespace enginebox
