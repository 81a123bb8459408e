#include "enginebox/errmsg.hh"
#include "enginebox/file_contents.hh"
#include "enginebox/file_descriptor.hh"
#include "enginebox/macros/throw.hh"

#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

size_t write_all(int fd, const void* buf, size_t len) noexcept {
    size_t pos = 0;
    errno = 0;
    while (pos < len) {
        auto rc = write(fd, static_cast<const char*>(buf) + pos, len - pos);
        if (rc > 0) {
            pos += static_cast<size_t>(rc);
        } else if (rc == 0 or errno != EINTR) {
            break;
        }
    }
    return pos;
}

size_t pread_all(int fd, off_t pos, void* buf, size_t len) noexcept {
    size_t done = 0;
    errno = 0;
    while (done < len) {
        auto rc = pread(
            fd, static_cast<char*>(buf) + done, len - done, pos + static_cast<off_t>(done));
        if (rc > 0) {
            done += static_cast<size_t>(rc);
        } else if (rc == 0) {
            errno = 0;
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    return done;
}

std::string get_file_contents(int fd) {
    struct stat st {};
    if (fstat(fd, &st)) {
        THROW("fstat()", errmsg());
    }
    // st_size is only a hint: files like the ones in /proc report 0
    std::string res(std::max(static_cast<size_t>(st.st_size) + 1, size_t{1} << 12), '\0');
    size_t pos = 0;
    for (;;) {
        pos += pread_all(fd, static_cast<off_t>(pos), res.data() + pos, res.size() - pos);
        if (pos < res.size()) {
            if (errno != 0) {
                THROW("pread()", errmsg());
            }
            break;
        }
        res.resize(res.size() * 2);
    }
    res.resize(pos);
    return res;
}

std::string get_file_contents(const std::string& path) {
    FileDescriptor fd{path.c_str(), O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("open(\"", path, "\")", errmsg());
    }
    return get_file_contents(fd);
}

void put_file_contents(const std::string& path, std::string_view data, mode_t mode) {
    FileDescriptor fd{path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode};
    if (not fd.is_open()) {
        THROW("open(\"", path, "\")", errmsg());
    }
    if (write_all(fd, data) != data.size()) {
        THROW("write(\"", path, "\")", errmsg());
    }
    if (fd.close()) {
        THROW("close(\"", path, "\")", errmsg());
    }
}
