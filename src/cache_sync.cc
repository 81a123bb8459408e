#include "enginebox/cache_sync.hh"
#include "enginebox/debug.hh"
#include "enginebox/errmsg.hh"
#include "enginebox/file_manip.hh"
#include "enginebox/macros/throw.hh"

#include <cerrno>

namespace {

constexpr DebugLogger<debug_logs_enabled> debuglog{};

} // namespace

namespace enginebox {

void sync_cache(
    const std::string& sandbox_dir, const std::optional<std::string>& cache_path,
    bool cache_changed) {
    if (not cache_changed) {
        debuglog("cache of ", sandbox_dir, " unchanged, skipping setup");
        return;
    }
    if (remove_r(sandbox_dir) and errno != ENOENT) {
        THROW("remove_r(\"", sandbox_dir, "\")", errmsg());
    }
    if (mkdir_r(sandbox_dir)) {
        THROW("mkdir_r(\"", sandbox_dir, "\")", errmsg());
    }
    if (not cache_path) {
        return;
    }

    CopyCapabilities caps;
    if (probe_copy_capabilities(sandbox_dir, caps)) {
        THROW("probe_copy_capabilities(\"", sandbox_dir, "\")", errmsg());
    }
    if (not caps.symlinks or not caps.permissions) {
        debuglog(
            "degraded copy into ", sandbox_dir, ": symlinks: ", caps.symlinks,
            ", permissions: ", caps.permissions);
    }
    if (copy_dir_contents(*cache_path, sandbox_dir, caps)) {
        THROW("copy_dir_contents(\"", *cache_path, "\", \"", sandbox_dir, "\")", errmsg());
    }
    debuglog("copied cache ", *cache_path, " into ", sandbox_dir);
}

} // namespace enginebox
