#include "enginebox/config.hh"
#include "enginebox/macros/throw.hh"

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace {

std::optional<std::string_view> get_env(const char* name) noexcept {
    const char* val = std::getenv(name); // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr or *val == '\0') {
        return std::nullopt;
    }
    return std::string_view{val};
}

template <class T>
std::optional<T> str2num(std::string_view str) noexcept {
    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return res;
}

template <class T>
std::optional<T> num_from_env(const char* name) {
    auto str = get_env(name);
    if (not str) {
        return std::nullopt;
    }
    auto num = str2num<T>(*str);
    if (not num) {
        THROW(name, " has to be a non-negative integer, got: ", *str);
    }
    return num;
}

std::optional<bool> bool_from_env(const char* name) {
    auto str = get_env(name);
    if (not str) {
        return std::nullopt;
    }
    if (*str == "true" or *str == "1") {
        return true;
    }
    if (*str == "false" or *str == "0") {
        return false;
    }
    THROW(name, " has to be one of: true, false, 1, 0, got: ", *str);
}

} // namespace

namespace enginebox {

Config Config::from_env() {
    Config config;
    if (auto limit = num_from_env<uint64_t>("ENGINEBOX_SANDBOX_MEMORY_LIMIT")) {
        config.sandbox_memory_limit = *limit;
    }
    if (auto path = get_env("ENGINEBOX_CACHE_PATH")) {
        config.cache_path = std::string{*path};
    }
    if (auto secs = num_from_env<uint32_t>("ENGINEBOX_SANDBOX_RUN_TIME_SECONDS")) {
        config.sandbox_run_time = std::chrono::seconds{*secs};
    }
    if (auto interpreter = get_env("ENGINEBOX_WORKER_INTERPRETER")) {
        config.worker_interpreter = std::string{*interpreter};
    }
    if (auto keep = bool_from_env("ENGINEBOX_KEEP_OUTPUT_ON_TIMEOUT")) {
        config.keep_output_on_timeout = *keep;
    }
    return config;
}

} // namespace enginebox
