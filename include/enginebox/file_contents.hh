#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <sys/types.h>

// Writes the whole buffer, retrying on EINTR and partial writes. Returns the number of
// bytes written; a value smaller than @p len means an error (errno is set).
size_t write_all(int fd, const void* buf, size_t len) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Reads up to @p len bytes starting at @p pos. Returns the number of bytes read; a value
// smaller than @p len means EOF (errno == 0) or an error (errno is set).
size_t pread_all(int fd, off_t pos, void* buf, size_t len) noexcept;

// Reads the whole contents of the file referred by @p fd (from offset 0), throws on error
std::string get_file_contents(int fd);

// Throws on error
std::string get_file_contents(const std::string& path);

// Creates or truncates the file, throws on error
void put_file_contents(const std::string& path, std::string_view data, mode_t mode = 0644);
