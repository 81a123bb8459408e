#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace enginebox {

// Process-wide settings, read once and passed around by value
struct Config {
    uint64_t sandbox_memory_limit = 524288; // in bytes
    // Root of sandbox directories; if unset, the directory of the running executable is used
    std::optional<std::string> cache_path;
    std::chrono::seconds sandbox_run_time{600};
    // Program used to run the entry module; if unset, the entry module is executed directly
    std::optional<std::string> worker_interpreter;
    // Whether output produced before a timeout is returned along with the TIMEOUT verdict
    bool keep_output_on_timeout = false;

    // Reads ENGINEBOX_SANDBOX_MEMORY_LIMIT, ENGINEBOX_CACHE_PATH,
    // ENGINEBOX_SANDBOX_RUN_TIME_SECONDS, ENGINEBOX_WORKER_INTERPRETER and
    // ENGINEBOX_KEEP_OUTPUT_ON_TIMEOUT; unset or empty variables keep the defaults.
    // Throws std::runtime_error on a malformed value.
    static Config from_env();
};

} // namespace enginebox
