#pragma once

#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <type_traits>
#include <unistd.h>
#include <utility>

class Directory {
    DIR* dir_ = nullptr;

public:
    Directory() noexcept = default;

    explicit Directory(const char* path) noexcept : dir_{opendir(path)} {}

    // Takes ownership of @p fd (also on failure)
    static Directory from_fd(int fd) noexcept {
        Directory res;
        res.dir_ = fdopendir(fd);
        if (res.dir_ == nullptr) {
            int errnum = errno;
            (void)::close(fd);
            errno = errnum;
        }
        return res;
    }

    Directory(const Directory&) = delete;

    Directory(Directory&& other) noexcept : dir_{std::exchange(other.dir_, nullptr)} {}

    Directory& operator=(const Directory&) = delete;

    Directory& operator=(Directory&& other) noexcept {
        close();
        dir_ = std::exchange(other.dir_, nullptr);
        return *this;
    }

    ~Directory() { close(); }

    [[nodiscard]] bool is_open() const noexcept { return dir_ != nullptr; }

    [[nodiscard]] DIR* get() const noexcept { return dir_; }

    [[nodiscard]] int fd() const noexcept { return ::dirfd(dir_); }

    void close() noexcept {
        if (dir_) {
            (void)closedir(std::exchange(dir_, nullptr));
        }
    }
};

// Calls @p func(dirent*) for every entry except "." and "..". If @p func returns bool,
// false stops the iteration. Returns 0 on success and -1 if readdir() failed (errno is set).
template <class Func>
int for_each_dir_component(Directory& dir, Func&& func) {
    for (;;) {
        errno = 0;
        dirent* ent = readdir(dir.get());
        if (ent == nullptr) {
            return errno == 0 ? 0 : -1;
        }
        if (strcmp(ent->d_name, ".") == 0 or strcmp(ent->d_name, "..") == 0) {
            continue;
        }
        if constexpr (std::is_same_v<std::invoke_result_t<Func&, dirent*>, bool>) {
            if (not func(ent)) {
                return 0;
            }
        } else {
            func(ent);
        }
    }
}
