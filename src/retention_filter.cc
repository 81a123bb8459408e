#include "enginebox/debug.hh"
#include "enginebox/directory.hh"
#include "enginebox/errmsg.hh"
#include "enginebox/file_manip.hh"
#include "enginebox/logger.hh"
#include "enginebox/retention_filter.hh"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

constexpr DebugLogger<debug_logs_enabled> debuglog{};

} // namespace

namespace enginebox {

int RetentionFilter::remove_entry(int dirfd, const char* name) const noexcept {
    struct stat st {};
    if (fstatat(dirfd, name, &st, AT_SYMLINK_NOFOLLOW)) {
        return -1;
    }
    return S_ISREG(st.st_mode) ? unlinkat(dirfd, name, 0) : remove_rat(dirfd, name);
}

void RetentionFilter::clean_up(const std::string& dir) const {
    Directory directory{dir.c_str()};
    if (not directory.is_open()) {
        if (errno != ENOENT) {
            errlog("clean up of ", dir, ": opendir()", errmsg());
        }
        return;
    }

    size_t removed = 0;
    auto rc = for_each_dir_component(directory, [&](dirent* ent) {
        if (keeps(ent->d_name)) {
            return;
        }
        if (remove_entry(directory.fd(), ent->d_name)) {
            errlog("clean up of ", dir, ": removing ", ent->d_name, errmsg());
            return;
        }
        ++removed;
    });
    if (rc) {
        errlog("clean up of ", dir, ": readdir()", errmsg());
    }
    debuglog("cleaned up ", dir, ": removed ", removed, " entries");
}

} // namespace enginebox
