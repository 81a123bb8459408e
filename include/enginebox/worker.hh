#pragma once

#include "enginebox/engine_response.hh"
#include "enginebox/resource_limits.hh"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace enginebox::worker {

struct Options {
    std::chrono::nanoseconds timeout;
    ResourceLimits limits;
    // If set, the worker runs `interpreter entry_path`, otherwise entry_path is executed
    std::optional<std::string> interpreter;
    // Defaults to the directory of the entry module
    std::optional<std::string> working_dir;
    bool keep_output_on_timeout = false;
};

// Runs one operation in a new worker process and returns exactly one verdict:
// - SUCCESS / ERROR as reported by the worker's result message,
// - TIMEOUT if the worker did not report before options.timeout (the worker is killed),
// - ERROR if the worker reported an error, sent a malformed message or exited without a
//   result.
// The worker and everything it spawned is dead once this function returns.
// Throws std::runtime_error only if the worker could not be created at all.
ExecutionResult execute(
    const std::string& entry_path, std::string_view operation_type,
    const nlohmann::json& operation, const Options& options);

} // namespace enginebox::worker
