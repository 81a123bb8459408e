#include "enginebox/directory.hh"
#include "enginebox/file_descriptor.hh"
#include "enginebox/file_manip.hh"

#include <cerrno>
#include <climits>
#include <cstdio>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

// Symlinks followed on one path in the degraded copy mode are bounded like in path
// resolution; real directory nesting is not bounded
constexpr int max_followed_symlinks = 40;

// Preserves errno of the first failure across cleanup calls
class ErrnoGuard {
    int errnum_ = errno;

public:
    ErrnoGuard() noexcept = default;
    ErrnoGuard(const ErrnoGuard&) = delete;
    ErrnoGuard(ErrnoGuard&&) = delete;
    ErrnoGuard& operator=(const ErrnoGuard&) = delete;
    ErrnoGuard& operator=(ErrnoGuard&&) = delete;

    ~ErrnoGuard() { errno = errnum_; }
};

int open_dir_at(int dirfd, const char* name, bool follow_symlinks) noexcept {
    return openat(
        dirfd, name, O_RDONLY | O_DIRECTORY | O_CLOEXEC | (follow_symlinks ? 0 : O_NOFOLLOW));
}

int copy_file_data(int src_fd, int dest_fd) noexcept {
    for (;;) {
        auto rc = copy_file_range(src_fd, nullptr, dest_fd, nullptr, 1 << 30, 0);
        if (rc == 0) {
            return 0;
        }
        if (rc > 0) {
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EXDEV and errno != EINVAL and errno != ENOSYS and errno != EOPNOTSUPP) {
            return -1;
        }
        break; // copy_file_range() unsupported for this pair of files
    }
    // Plain read/write fallback, continues from the current offsets
    char buff[1 << 16];
    for (;;) {
        auto len = read(src_fd, buff, sizeof(buff));
        if (len == 0) {
            return 0;
        }
        if (len < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        }
        size_t written = 0;
        while (written < static_cast<size_t>(len)) {
            auto rc = write(dest_fd, buff + written, static_cast<size_t>(len) - written);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return -1;
            }
            written += static_cast<size_t>(rc);
        }
    }
}

int copy_regular_file_at(
    int src_dirfd, const char* name, int dest_dirfd, bool follow_symlinks,
    CopyCapabilities caps) noexcept {
    FileDescriptor src{
        openat(src_dirfd, name, O_RDONLY | O_CLOEXEC | (follow_symlinks ? 0 : O_NOFOLLOW))};
    if (not src.is_open()) {
        return -1;
    }
    struct stat st {};
    if (fstat(src, &st)) {
        return -1;
    }
    mode_t mode = caps.permissions ? (st.st_mode & 07777) : 0644;
    FileDescriptor dest{
        openat(dest_dirfd, name, O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR)};
    if (not dest.is_open()) {
        return -1;
    }
    if (copy_file_data(src, dest)) {
        return -1;
    }
    // Set the mode only now, as umask affects openat() and the mode may forbid writing
    if (fchmod(dest, mode)) {
        return -1;
    }
    return dest.close();
}

int copy_at(
    int src_dirfd, const char* name, int dest_dirfd, CopyCapabilities caps,
    int followed_symlinks) noexcept;

int copy_dir_contents_at(
    int src_fd, int dest_fd, CopyCapabilities caps, int followed_symlinks) noexcept {
    int src_copy = fcntl(src_fd, F_DUPFD_CLOEXEC, 0);
    if (src_copy == -1) {
        return -1;
    }
    Directory dir = Directory::from_fd(src_copy);
    if (not dir.is_open()) {
        return -1;
    }
    int rc = 0;
    if (for_each_dir_component(dir, [&](dirent* ent) {
            if (copy_at(dir.fd(), ent->d_name, dest_fd, caps, followed_symlinks)) {
                rc = -1;
                return false;
            }
            return true;
        }))
    {
        return -1;
    }
    return rc;
}

int copy_directory_at(
    int src_dirfd, const char* name, int dest_dirfd, bool follow_symlinks,
    CopyCapabilities caps, int followed_symlinks) noexcept {
    FileDescriptor src{open_dir_at(src_dirfd, name, follow_symlinks)};
    if (not src.is_open()) {
        return -1;
    }
    struct stat st {};
    if (fstat(src, &st)) {
        return -1;
    }
    // Owner needs full access while the contents are copied, the real mode is set afterwards
    if (mkdirat(dest_dirfd, name, S_IRWXU)) {
        return -1;
    }
    FileDescriptor dest{open_dir_at(dest_dirfd, name, false)};
    if (not dest.is_open()) {
        return -1;
    }
    if (copy_dir_contents_at(src, dest, caps, followed_symlinks)) {
        return -1;
    }
    mode_t mode = caps.permissions ? (st.st_mode & 07777) : 0755;
    if (fchmod(dest, mode)) {
        return -1;
    }
    return dest.close();
}

int copy_at(
    int src_dirfd, const char* name, int dest_dirfd, CopyCapabilities caps,
    int followed_symlinks) noexcept {
    struct stat st {};
    if (fstatat(src_dirfd, name, &st, AT_SYMLINK_NOFOLLOW)) {
        return -1;
    }
    bool follow = false;
    if (S_ISLNK(st.st_mode)) {
        if (caps.symlinks) {
            char target[PATH_MAX];
            auto len = readlinkat(src_dirfd, name, target, sizeof(target) - 1);
            if (len < 0) {
                return -1;
            }
            target[len] = '\0';
            return symlinkat(target, dest_dirfd, name);
        }
        // Degraded mode: copy what the symlink points to
        if (++followed_symlinks > max_followed_symlinks) {
            errno = ELOOP;
            return -1;
        }
        if (fstatat(src_dirfd, name, &st, 0)) {
            return -1;
        }
        follow = true;
    }
    if (S_ISREG(st.st_mode)) {
        return copy_regular_file_at(src_dirfd, name, dest_dirfd, follow, caps);
    }
    if (S_ISDIR(st.st_mode)) {
        return copy_directory_at(
            src_dirfd, name, dest_dirfd, follow, caps, followed_symlinks);
    }
    if (S_ISFIFO(st.st_mode)) {
        return mkfifoat(dest_dirfd, name, caps.permissions ? (st.st_mode & 07777) : 0644);
    }
    // Sockets and device files have no meaning in a copied snapshot
    errno = EOPNOTSUPP;
    return -1;
}

} // namespace

int remove_rat(int dirfd, const char* name) noexcept {
    struct stat st {};
    if (fstatat(dirfd, name, &st, AT_SYMLINK_NOFOLLOW)) {
        return -1;
    }
    if (not S_ISDIR(st.st_mode)) {
        return unlinkat(dirfd, name, 0);
    }
    Directory dir = Directory::from_fd(open_dir_at(dirfd, name, false));
    if (not dir.is_open()) {
        return -1;
    }
    int rc = 0;
    if (for_each_dir_component(dir, [&](dirent* ent) {
            if (remove_rat(dir.fd(), ent->d_name)) {
                rc = -1;
                return false;
            }
            return true;
        }))
    {
        return -1;
    }
    if (rc) {
        return -1;
    }
    dir.close();
    return unlinkat(dirfd, name, AT_REMOVEDIR);
}

int mkdir_r(std::string path, mode_t mode) noexcept {
    if (path.empty()) {
        errno = ENOENT;
        return -1;
    }
    // Create every prefix ending just before a slash, then the whole path
    for (size_t pos = path.find('/', 1); pos != std::string::npos;
         pos = path.find('/', pos + 1))
    {
        path[pos] = '\0';
        if (mkdir(path.c_str(), mode) and errno != EEXIST) {
            return -1;
        }
        path[pos] = '/';
    }
    if (mkdir(path.c_str(), mode) and errno != EEXIST) {
        return -1;
    }
    struct stat st {};
    if (stat(path.c_str(), &st)) {
        return -1;
    }
    if (not S_ISDIR(st.st_mode)) {
        errno = ENOTDIR;
        return -1;
    }
    return 0;
}

int probe_copy_capabilities(const std::string& dir, CopyCapabilities& caps) noexcept {
    FileDescriptor dirfd{open_dir_at(AT_FDCWD, dir.c_str(), true)};
    if (not dirfd.is_open()) {
        return -1;
    }
    char name[64];
    (void)snprintf(name, sizeof(name), ".enginebox-probe-%d", getpid());

    if (symlinkat("target", dirfd, name) == 0) {
        caps.symlinks = true;
        if (unlinkat(dirfd, name, 0)) {
            return -1;
        }
    } else if (errno == EPERM or errno == EOPNOTSUPP or errno == ENOSYS) {
        caps.symlinks = false;
    } else {
        return -1;
    }

    FileDescriptor fd{openat(dirfd, name, O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600)};
    if (not fd.is_open()) {
        return -1;
    }
    // A mode with bits the umask would not touch and a default mode would not have
    constexpr mode_t probe_mode = 0751;
    struct stat st {};
    bool failed = fchmod(fd, probe_mode) and errno != EPERM and errno != EOPNOTSUPP;
    if (not failed) {
        failed = fstat(fd, &st) != 0;
    }
    if (failed) {
        ErrnoGuard guard;
        (void)unlinkat(dirfd, name, 0);
        return -1;
    }
    caps.permissions = (st.st_mode & 07777) == probe_mode;
    (void)fd.close();
    return unlinkat(dirfd, name, 0);
}

int copy_dir_contents(
    const std::string& src, const std::string& dest, CopyCapabilities caps) noexcept {
    FileDescriptor src_fd{open_dir_at(AT_FDCWD, src.c_str(), true)};
    if (not src_fd.is_open()) {
        return -1;
    }
    FileDescriptor dest_fd{open_dir_at(AT_FDCWD, dest.c_str(), true)};
    if (not dest_fd.is_open()) {
        return -1;
    }
    return copy_dir_contents_at(src_fd, dest_fd, caps, 0);
}
