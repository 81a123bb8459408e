#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace enginebox {

enum class EngineResponseStatus : uint8_t {
    Success,
    Error,
    Timeout,
};

// "SUCCESS", "ERROR" or "TIMEOUT"
const char* to_str(EngineResponseStatus status) noexcept;

std::optional<EngineResponseStatus>
engine_response_status_from_str(std::string_view str) noexcept;

// Normalized outcome of an operation, as reported by the worker
struct EngineResponse {
    EngineResponseStatus status;
    nlohmann::json response = nlohmann::json::object();
};

// Parses {"status": "SUCCESS" | "ERROR" | "TIMEOUT", "response": <any>}; a missing
// response becomes an empty object. Returns std::nullopt if @p json has another shape.
std::optional<EngineResponse> parse_engine_response(const nlohmann::json& json);

struct ExecutionResult {
    double time_in_seconds = 0; // from spawning the worker until its verdict
    EngineResponseStatus verdict = EngineResponseStatus::Error;
    nlohmann::json output = nlohmann::json::object();
    std::string standard_output;
    std::string standard_error;
};

// {"timeInSeconds", "verdict", "output", "standardOutput", "standardError"}
void to_json(nlohmann::json& json, const ExecutionResult& res);

} // namespace enginebox
