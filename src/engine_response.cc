#include "enginebox/engine_response.hh"

#include <string>

namespace {

// Raw output of the worker is arbitrary bytes; invalid UTF-8 sequences are replaced with
// U+FFFD, so that the JSON can always be serialized
std::string valid_utf8(const std::string& str) {
    auto dumped =
        nlohmann::json(str).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return nlohmann::json::parse(dumped).get<std::string>();
}

} // namespace

namespace enginebox {

const char* to_str(EngineResponseStatus status) noexcept {
    switch (status) {
    case EngineResponseStatus::Success: return "SUCCESS";
    case EngineResponseStatus::Error: return "ERROR";
    case EngineResponseStatus::Timeout: return "TIMEOUT";
    }
    return "UNKNOWN";
}

std::optional<EngineResponseStatus>
engine_response_status_from_str(std::string_view str) noexcept {
    for (auto status :
         {EngineResponseStatus::Success, EngineResponseStatus::Error,
          EngineResponseStatus::Timeout})
    {
        if (str == to_str(status)) {
            return status;
        }
    }
    return std::nullopt;
}

std::optional<EngineResponse> parse_engine_response(const nlohmann::json& json) {
    if (not json.is_object()) {
        return std::nullopt;
    }
    auto status_it = json.find("status");
    if (status_it == json.end() or not status_it->is_string()) {
        return std::nullopt;
    }
    auto status = engine_response_status_from_str(status_it->get_ref<const std::string&>());
    if (not status) {
        return std::nullopt;
    }
    auto response_it = json.find("response");
    return EngineResponse{
        .status = *status,
        .response = response_it == json.end() ? nlohmann::json::object() : *response_it,
    };
}

void to_json(nlohmann::json& json, const ExecutionResult& res) {
    json = {
        {"timeInSeconds", res.time_in_seconds},
        {"verdict", to_str(res.verdict)},
        {"output", res.output},
        {"standardOutput", valid_utf8(res.standard_output)},
        {"standardError", valid_utf8(res.standard_error)},
    };
}

} // namespace enginebox
