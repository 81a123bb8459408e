#include "enginebox/cache_sync.hh"
#include "enginebox/concat_tostr.hh"
#include "enginebox/debug.hh"
#include "enginebox/errmsg.hh"
#include "enginebox/macros/throw.hh"
#include "enginebox/sandbox.hh"
#include "enginebox/worker.hh"

#include <climits>
#include <stdexcept>
#include <unistd.h>

namespace {

constexpr DebugLogger<debug_logs_enabled> debuglog{};

// Directory containing the running executable
std::string executable_dir() {
    char buff[PATH_MAX];
    auto len = readlink("/proc/self/exe", buff, sizeof(buff));
    if (len == -1) {
        THROW("readlink(\"/proc/self/exe\")", errmsg());
    }
    std::string path(buff, static_cast<size_t>(len));
    auto pos = path.rfind('/');
    return pos == 0 ? "/" : path.substr(0, pos);
}

std::string absolute_path(std::string path) {
    if (not path.empty() and path.front() == '/') {
        return path;
    }
    char buff[PATH_MAX];
    if (getcwd(buff, sizeof(buff)) == nullptr) {
        THROW("getcwd()", errmsg());
    }
    return concat_tostr(buff, '/', path);
}

std::string sandbox_folder_path(const enginebox::Config& config, const std::string& box_id) {
    auto root = absolute_path(config.cache_path.value_or(executable_dir()));
    while (root.size() > 1 and root.back() == '/') {
        root.pop_back();
    }
    return concat_tostr(root == "/" ? "" : root, "/sandbox/", box_id);
}

} // namespace

namespace enginebox {

Sandbox::Sandbox(std::string box_id, Config config)
: box_id_{std::move(box_id)}
, config_{std::move(config)}
, limits_{resource_limits_for(config_.sandbox_memory_limit)}
, retention_filter_{engine_files}
, folder_path_{sandbox_folder_path(config_, box_id_)} {
    if (box_id_.empty() or box_id_.find('/') != std::string::npos or box_id_ == "." or
        box_id_ == "..")
    {
        throw std::invalid_argument{concat_tostr("invalid sandbox id: \"", box_id_, '"')};
    }
}

void Sandbox::use_cache(std::string cache_key, std::optional<std::string> cache_path) {
    bool cache_changed = cache_key_ != cache_key;
    cache_key_ = std::move(cache_key);
    cache_path_ = std::move(cache_path);
    setup_cache(cache_changed);
}

void Sandbox::setup_cache(bool cache_changed) {
    // Contents of a slot that was never set up successfully cannot be trusted
    cache_changed = cache_changed or not cache_ready_;
    debuglog(
        "[", box_id_, "] setup cache: key: ", cache_key_.value_or("(none)"),
        ", path: ", cache_path_.value_or("(none)"), ", changed: ", cache_changed);
    cache_ready_ = false;
    sync_cache(folder_path_, cache_path_, cache_changed);
    cache_ready_ = true;
}

ExecutionResult
Sandbox::run_operation(std::string_view operation_type, const nlohmann::json& operation) {
    if (not cache_ready_) {
        throw std::logic_error{
            concat_tostr("sandbox ", box_id_, ": run_operation() before setup_cache()")};
    }
    return worker::execute(
        concat_tostr(folder_path_, '/', entry_module), operation_type, operation,
        {
            .timeout = config_.sandbox_run_time,
            .limits = limits_,
            .interpreter = config_.worker_interpreter,
            .working_dir = folder_path_,
            .keep_output_on_timeout = config_.keep_output_on_timeout,
        });
}

void Sandbox::clean_up() {
    debuglog("[", box_id_, "] clean up");
    retention_filter_.clean_up(folder_path_);
}

} // namespace enginebox
