#pragma once

#include "enginebox/config.hh"
#include "enginebox/engine_response.hh"
#include "enginebox/resource_limits.hh"
#include "enginebox/retention_filter.hh"

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace enginebox {

// Entry module of the worker, relative to the sandbox directory
inline constexpr std::string_view entry_module = "main.js";

// Entries reused by the next run without setting up the cache again
inline const std::set<std::string, std::less<>> engine_files = {
    "codes", "node_modules", "main.js", "main.js.map", "package.json",
};

// A reusable slot: setup_cache() -> run_operation()* -> clean_up(). A single slot must not
// be used concurrently, different slots are independent.
class Sandbox {
    std::string box_id_;
    Config config_;
    ResourceLimits limits_;
    RetentionFilter retention_filter_;
    std::string folder_path_;
    std::optional<std::string> cache_key_;
    std::optional<std::string> cache_path_;
    bool cache_ready_ = false;

public:
    Sandbox(std::string box_id, Config config);

    [[nodiscard]] const std::string& box_id() const noexcept { return box_id_; }

    // <cache root>/sandbox/<box id>
    [[nodiscard]] const std::string& folder_path() const noexcept { return folder_path_; }

    [[nodiscard]] const std::optional<std::string>& cache_key() const noexcept {
        return cache_key_;
    }

    [[nodiscard]] const std::optional<std::string>& cache_path() const noexcept {
        return cache_path_;
    }

    [[nodiscard]] const ResourceLimits& resource_limits() const noexcept { return limits_; }

    // Switches the slot to the snapshot at @p cache_path identified by @p cache_key; the
    // snapshot is copied only if the key differs from the one of the last successful setup.
    // Throws like setup_cache().
    void use_cache(std::string cache_key, std::optional<std::string> cache_path);

    // Recreates the sandbox directory from the current cache path if @p cache_changed or
    // if there was no successful setup yet.
    // Throws std::runtime_error on failure; run_operation() is refused until a later
    // setup succeeds.
    void setup_cache(bool cache_changed);

    // Runs the operation in a new worker. Timeouts and worker failures are reported in the
    // result. Throws std::logic_error if the cache was not set up.
    ExecutionResult run_operation(std::string_view operation_type, const nlohmann::json& operation);

    // Removes everything from the sandbox directory except engine_files; never throws on
    // filesystem errors (they are logged)
    void clean_up();
};

} // namespace enginebox
