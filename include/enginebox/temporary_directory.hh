#pragma once

#include <string>

// Creates a fresh directory and removes it recursively on destruction
class TemporaryDirectory {
    std::string path_; // without trailing '/'

public:
    TemporaryDirectory() = default;

    // @p templ has to end with "XXXXXX" (see mkdtemp(3)), throws on error
    explicit TemporaryDirectory(std::string templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory(TemporaryDirectory&&) noexcept = default;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

    ~TemporaryDirectory();

    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
};
