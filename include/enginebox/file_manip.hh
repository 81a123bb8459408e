#pragma once

#include <fcntl.h>
#include <string>
#include <sys/types.h>

// Removes @p name (relative to @p dirfd) with all its contents. Symlinks are removed, never
// followed. Returns 0 on success, -1 on error (errno is set).
int remove_rat(int dirfd, const char* name) noexcept;

inline int remove_r(const std::string& path) noexcept {
    return remove_rat(AT_FDCWD, path.c_str());
}

// Creates directory @p path together with missing parents. Returns 0 on success (also if the
// directory already existed), -1 on error (errno is set).
int mkdir_r(std::string path, mode_t mode = 0755) noexcept;

// What the filesystem holding a copy destination is able to store
struct CopyCapabilities {
    bool symlinks = true;
    bool permissions = true;
};

// Probes the filesystem of directory @p dir by creating (and removing) temporary entries in
// it. Returns 0 on success, -1 on error (errno is set).
int probe_copy_capabilities(const std::string& dir, CopyCapabilities& caps) noexcept;

// Copies the contents of directory @p src into the existing directory @p dest. Symlinks and
// permission bits are preserved as far as @p caps allow; otherwise symlinks are replaced
// by copies of their targets and permissions are left at defaults. Returns 0 on success,
// -1 on error (errno is set).
int copy_dir_contents(
    const std::string& src, const std::string& dest, CopyCapabilities caps) noexcept;
